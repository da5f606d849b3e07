#pragma once

#include <string>
#include <string_view>

#include <boost/filesystem/path.hpp>

#include "Ruleset.hpp"

namespace lexpath::path {

namespace fs = boost::filesystem;

/**
 * @brief Lexically clean a path without touching the filesystem
 *
 * Repeated separators are collapsed, "." is removed, ".." removes the name
 * preceding it, ".." directly under a root is removed and ".." at the start
 * of a relative path is kept. An empty result becomes ".". Prefixes (root,
 * drive, UNC share) are kept and written with the canonical separator.
 *
 * @param path - path to clean
 * @param ruleset - conventions to interpret path under
 * @return cleaned path, never empty
 */
[[nodiscard]] std::string clean(std::string_view path, Ruleset ruleset);

[[nodiscard]] std::string cleanUnix(std::string_view path);

[[nodiscard]] std::string cleanWindows(std::string_view path);

/**
 * @brief Clean using the rules of the platform the library was built for
 */
[[nodiscard]] std::string clean(std::string_view path);

[[nodiscard]] fs::path cleanPath(const fs::path& path);

}
