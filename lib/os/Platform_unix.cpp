#include "Platform.hpp"

#ifdef BUILDING_UNIX

namespace lexpath::os {

path::Ruleset Platform::ruleset() noexcept {
    return path::Ruleset::Unix;
}

}

#endif
