#include "Prefix.hpp"

#include <algorithm>
#include <iterator>

namespace lexpath::path {

namespace {

constexpr bool isDriveLetter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr std::string_view::size_type findSeparator(std::string_view str, std::string_view::size_type from) noexcept {
    for (auto i = from; i < str.size(); ++i) {
        if (WindowsRules::isSeparator(str[i]))
            return i;
    }

    return std::string_view::npos;
}

bool parseUnc(std::string_view path, Prefix& prefix) {
    if (path.size() < 3 || !WindowsRules::isSeparator(path[0]) || !WindowsRules::isSeparator(path[1]))
        return false;

    if (WindowsRules::isSeparator(path[2]))
        return false;

    const auto serverEnd = findSeparator(path, 2);
    if (serverEnd == std::string_view::npos)
        return false;

    const auto shareBegin = serverEnd + 1;
    if (shareBegin == path.size() || WindowsRules::isSeparator(path[shareBegin]))
        return false;

    const auto shareEnd = std::min(findSeparator(path, shareBegin), path.size());

    // "\\.\" and "\\?\" device prefixes keep their shape, dot shares do not
    const auto server = path.substr(2, serverEnd - 2);
    const auto share = path.substr(shareBegin, shareEnd - shareBegin);
    if (server == ".." || share == "." || share == "..")
        return false;

    prefix.kind = Prefix::Kind::Unc;
    prefix.text.reserve(shareEnd);
    prefix.text.append(2, WindowsRules::separator);
    prefix.text.append(server);
    prefix.text.push_back(WindowsRules::separator);
    prefix.text.append(share);
    prefix.rooted = true;
    prefix.rest = path.substr(shareEnd);

    return true;
}

}

Prefix parseUnixPrefix(std::string_view path) {
    Prefix prefix;

    const auto first = std::find_if_not(std::cbegin(path), std::cend(path), &UnixRules::isSeparator);
    const auto skipped = static_cast<std::string_view::size_type>(std::distance(std::cbegin(path), first));

    if (skipped > 0) {
        prefix.kind = Prefix::Kind::Root;
        prefix.rooted = true;
    }

    prefix.rest = path.substr(skipped);

    return prefix;
}

Prefix parseWindowsPrefix(std::string_view path) {
    Prefix prefix;

    if (parseUnc(path, prefix))
        return prefix;

    if (isDriveSpec(path)) {
        prefix.kind = Prefix::Kind::Drive;
        prefix.text.assign(path.substr(0, 2));
        prefix.rooted = path.size() > 2 && WindowsRules::isSeparator(path[2]);
        prefix.rest = path.substr(2);

        return prefix;
    }

    if (!path.empty() && WindowsRules::isSeparator(path[0])) {
        prefix.kind = Prefix::Kind::Root;
        prefix.rooted = true;
        prefix.rest = path.substr(1);

        return prefix;
    }

    prefix.rest = path;

    return prefix;
}

bool isDriveSpec(std::string_view segment) noexcept {
    return segment.size() >= 2 && isDriveLetter(segment[0]) && segment[1] == ':';
}

Prefix parsePrefix(std::string_view path, Ruleset ruleset) {
    if (ruleset == Ruleset::Windows)
        return parseWindowsPrefix(path);

    return parseUnixPrefix(path);
}

}
