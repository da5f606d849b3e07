#include "Platform.hpp"

#ifdef BUILDING_WINDOWS

namespace lexpath::os {

    path::Ruleset Platform::ruleset() noexcept {
        return path::Ruleset::Windows;
    }

}

#endif
