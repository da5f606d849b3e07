#include "Ruleset.hpp"

namespace lexpath::path {

std::string_view name(Ruleset ruleset) noexcept {
    switch (ruleset) {
        case Ruleset::Unix:
            return "unix";
        case Ruleset::Windows:
            return "windows";
    }

    return "unknown";
}

}
