#pragma once

#include <string>
#include <string_view>

#include "Ruleset.hpp"

namespace lexpath::path {

/**
 * @brief Leading part of a path that segment resolution never touches
 *
 * A cleaned path is assembled as text + (rooted ? separator : "") + segments.
 * rest views into the parsed string and is only valid while it lives.
 */
struct Prefix {
    enum class Kind: unsigned {
        None,   // relative
        Root,   // "/a" on Unix, "\a" on Windows
        Drive,  // "C:a" or "C:\a"
        Unc     // "\\server\share\a"
    };

    Kind kind{Kind::None};
    std::string text{};
    bool rooted{false};
    std::string_view rest{};
};

/**
 * @brief Detect the Unix prefix. Any number of leading separators is a single root
 * @param path - path to inspect
 */
[[nodiscard]] Prefix parseUnixPrefix(std::string_view path);

/**
 * @brief Detect the Windows prefix, trying UNC, then drive, then root
 *
 * UNC needs exactly two leading separators, a server name, one separator and a
 * share name followed by a separator or the end of input. A ".." server or a
 * "." / ".." share is not UNC, device prefixes ("\\.\", "\\?\") are. Anything
 * else that starts with a separator is a driveless root.
 *
 * @param path - path to inspect
 */
[[nodiscard]] Prefix parseWindowsPrefix(std::string_view path);

/**
 * @brief Check whether segment starts with a drive specification ("C:")
 */
[[nodiscard]] bool isDriveSpec(std::string_view segment) noexcept;

[[nodiscard]] Prefix parsePrefix(std::string_view path, Ruleset ruleset);

}
