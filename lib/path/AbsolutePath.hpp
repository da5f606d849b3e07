#pragma once

#include <string>
#include <string_view>

#include <boost/filesystem/path.hpp>

#include <util/Status.hpp>

#include "Ruleset.hpp"

namespace lexpath::path {

namespace fs = boost::filesystem;

using util::Status;

/**
 * @brief Check whether path is anchored at a root that identifies a location on its own
 *
 * Unix: starts with a separator. Windows: UNC share, or drive letter followed by
 * a separator. A driveless "\a" or a drive-relative "C:a" is not absolute.
 */
[[nodiscard]] bool isAbsolute(std::string_view path, Ruleset ruleset);

/**
 * @brief Normalize path to an absolute path relative to a base directory without accessing the filesystem
 * @param baseDir - absolute base directory, typically the current working directory
 * @param path - path to resolve, empty means baseDir itself
 * @param ruleset - conventions both paths are interpreted under
 * @param result - cleaned absolute path
 * @return Status::Ok() on success, Status::NotAbsolute() if baseDir is not absolute,
 * Status::DriveMismatch() if path is relative to another drive
 */
[[nodiscard]] Status absolutePath(std::string_view baseDir, std::string_view path, Ruleset ruleset, std::string& result);

[[nodiscard]] Status absolutePath(std::string_view baseDir, std::string_view path, std::string& result);

[[nodiscard]] Status absolutePath(const fs::path& baseDir, const fs::path& path, fs::path& result);

}
