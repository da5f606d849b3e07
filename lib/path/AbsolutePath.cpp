#include "AbsolutePath.hpp"

#include <cctype>

#include "os/Platform.hpp"
#include "util/Log.hpp"

#include "Clean.hpp"
#include "Prefix.hpp"

namespace lexpath::path {

using util::Log;

namespace {

const char* TAG = "AbsolutePath";

bool sameDrive(const Prefix& lhs, const Prefix& rhs) {
    if (lhs.kind != Prefix::Kind::Drive || rhs.kind != Prefix::Kind::Drive)
        return false;

    return std::toupper(static_cast<unsigned char>(lhs.text[0])) ==
           std::toupper(static_cast<unsigned char>(rhs.text[0]));
}

}

bool isAbsolute(std::string_view path, Ruleset ruleset) {
    const auto prefix = parsePrefix(path, ruleset);

    switch (prefix.kind) {
        case Prefix::Kind::Root:
            return ruleset == Ruleset::Unix;
        case Prefix::Kind::Drive:
        case Prefix::Kind::Unc:
            return prefix.rooted;
        case Prefix::Kind::None:
            break;
    }

    return false;
}

Status absolutePath(std::string_view baseDir, std::string_view path, Ruleset ruleset, std::string& result) {
    if (!isAbsolute(baseDir, ruleset)) {
        Log::w(TAG, "Base directory ", baseDir, " is not absolute");

        return Status::NotAbsolute("Base directory is not absolute");
    }

    if (path.empty() || isAbsolute(path, ruleset)) {
        result = clean(path.empty() ? baseDir : path, ruleset);

        return Status::Ok();
    }

    const auto sep = separator(ruleset);
    const auto pathPrefix = parsePrefix(path, ruleset);

    std::string joined;

    switch (pathPrefix.kind) {
        case Prefix::Kind::Root:
            // Windows driveless root stays on the base drive or share
            joined.append(parsePrefix(baseDir, ruleset).text);
            joined.append(path);
            break;

        case Prefix::Kind::Drive:
            if (!sameDrive(parsePrefix(baseDir, ruleset), pathPrefix)) {
                Log::w(TAG, "Path ", path, " is relative to a drive other than ", baseDir);

                return Status::DriveMismatch("Path is on another drive");
            }

            joined.append(baseDir);
            joined.push_back(sep);
            joined.append(pathPrefix.rest);
            break;

        default:
            joined.append(baseDir);
            joined.push_back(sep);
            joined.append(path);
            break;
    }

    result = clean(joined, ruleset);

    Log::d(TAG, name(ruleset), ": ", baseDir, " + ", path, " -> ", result);

    return Status::Ok();
}

Status absolutePath(std::string_view baseDir, std::string_view path, std::string& result) {
    return absolutePath(baseDir, path, os::Platform::ruleset(), result);
}

Status absolutePath(const fs::path& baseDir, const fs::path& path, fs::path& result) {
    std::string ret;

    auto status = absolutePath(baseDir.string(), path.string(), ret);
    if (status.isOk())
        result = ret;

    return status;
}

}
