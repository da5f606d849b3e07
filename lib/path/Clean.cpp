#include "Clean.hpp"

#include "os/Platform.hpp"
#include "util/String.hpp"

#include "Prefix.hpp"
#include "SegmentStack.hpp"

namespace lexpath::path {

namespace {

template <typename Rules>
std::string cleanWith(std::string_view path) {
    if (path.empty())
        return std::string{SegmentStack::CurrentDir};

    const auto prefix = parsePrefix(path, Rules::ruleset);

    SegmentStack stack{prefix.rooted};

    for (auto&& segment : util::split(prefix.rest, &Rules::isSeparator))
        stack.push(segment);

    std::string ret;
    ret.reserve(path.size() + 1);

    ret.append(prefix.text);

    // a relative path must not start with something read back as a drive
    if constexpr (Rules::ruleset == Ruleset::Windows) {
        if (prefix.kind == Prefix::Kind::None && !stack.empty() && isDriveSpec(stack.segments().front().text)) {
            ret.append(SegmentStack::CurrentDir);
            ret.push_back(Rules::separator);
        }
    }

    if (prefix.rooted)
        ret.push_back(Rules::separator);

    ret.append(stack.join(Rules::separator));

    if (ret.empty())
        return std::string{SegmentStack::CurrentDir};

    return ret;
}

}

std::string clean(std::string_view path, Ruleset ruleset) {
    if (ruleset == Ruleset::Windows)
        return cleanWith<WindowsRules>(path);

    return cleanWith<UnixRules>(path);
}

std::string cleanUnix(std::string_view path) {
    return cleanWith<UnixRules>(path);
}

std::string cleanWindows(std::string_view path) {
    return cleanWith<WindowsRules>(path);
}

std::string clean(std::string_view path) {
    return clean(path, os::Platform::ruleset());
}

fs::path cleanPath(const fs::path& path) {
    return fs::path{clean(path.string())};
}

}
