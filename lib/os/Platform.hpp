#pragma once

#include <path/Ruleset.hpp>

namespace lexpath::os {

/**
 * @brief Path conventions of the platform the library is built for
 */
struct Platform final {
    Platform() = delete;

    [[nodiscard]] static path::Ruleset ruleset() noexcept;
};

}
