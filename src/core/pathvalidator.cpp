#include "pathvalidator.hpp"
#include "logging.hpp"

#include <algorithm>
#include <system_error>

namespace Kalkan::Core {

namespace fs = std::filesystem;

PathValidator::PathValidator(PathValidatorOptions options)
    : options_(std::move(options))
{
    if (options_.allowedRoots.empty()) {
        options_.allowedRoots.push_back(fs::current_path().string());
    }

    for (const auto& root : options_.allowedRoots) {
        allowedRoots_.push_back(normalizePath(root));
    }
}

Result<std::string> PathValidator::validatePath(const std::string& path, const ValidateOptions& options) const {
    if (path.empty()) {
        return Result<std::string>(ErrorKind::InvalidInput, "INVALID_INPUT", "Path must be a non-empty string");
    }

    // Both checks run before anything touches the file system
    if (containsNullBytes(path)) {
        return Result<std::string>(ErrorKind::InvalidInput, "NULL_BYTE", "Path contains null bytes");
    }

    if (!isPathLengthValid(path)) {
        SecurityError error(ErrorKind::InvalidInput, "PATH_TOO_LONG",
                            "Path exceeds maximum length of " + std::to_string(options_.maxPathLength) + " characters");
        error.withLimit(static_cast<std::int64_t>(options_.maxPathLength), static_cast<std::int64_t>(path.size()));
        return Result<std::string>(error);
    }

    fs::path resolved;
    try {
        resolved = normalizePath(path);
    } catch (const fs::filesystem_error& e) {
        return Result<std::string>(ErrorKind::InvalidInput, "VALIDATION_ERROR", "Path validation failed", e.what());
    }

    if (options_.resolveSymlinks) {
        std::error_code ec;
        const auto status = fs::symlink_status(resolved, ec);
        if (!ec && fs::is_symlink(status)) {
            fs::path target = fs::canonical(resolved, ec);
            if (ec) {
                return Result<std::string>(ErrorKind::InvalidInput, "SYMLINK_ERROR",
                                           "Cannot resolve symbolic link: " + ec.message(), path);
            }
            resolved = target;
        }
    }

    if (!isWithinAllowedRoot(resolved)) {
        qCWarning(lcPath) << "Rejected path outside allowed roots:" << QString::fromStdString(path);
        return Result<std::string>(ErrorKind::PathTraversal, "PATH_TRAVERSAL_DETECTED",
                                   "Path is outside allowed directories", path);
    }

    if (options_.requireExists || options.requireExists) {
        std::error_code ec;
        if (!fs::exists(resolved, ec)) {
            return Result<std::string>(ErrorKind::InvalidInput, "PATH_NOT_FOUND", "Path does not exist", path);
        }
    }

    return Result<std::string>(resolved.string());
}

Result<PathMetadata> PathValidator::validatePathWithMetadata(const std::string& path, const ValidateOptions& options) const {
    auto validated = validatePath(path, options);
    if (!validated.isSuccess()) {
        return Result<PathMetadata>(validated.error());
    }

    PathMetadata metadata;
    metadata.originalPath = path;
    metadata.validatedPath = validated.value();

    std::error_code ec;
    const auto status = fs::status(metadata.validatedPath, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            metadata.statError = ec.message();
        }
        return Result<PathMetadata>(metadata);
    }

    metadata.exists = fs::exists(status);
    metadata.isDirectory = fs::is_directory(status);
    metadata.isFile = fs::is_regular_file(status);
    if (metadata.isFile) {
        const auto size = fs::file_size(metadata.validatedPath, ec);
        if (ec) {
            metadata.statError = ec.message();
        } else {
            metadata.size = size;
        }
    }

    return Result<PathMetadata>(metadata);
}

PathBatchResult PathValidator::validatePaths(const std::vector<std::string>& paths, const ValidateOptions& options) const {
    PathBatchResult results;

    for (const auto& path : paths) {
        auto validated = validatePath(path, options);
        if (validated.isSuccess()) {
            results.valid.push_back({path, validated.value()});
        } else {
            results.invalid.push_back(path);
            results.errors.push_back({path, validated.error()});
        }
    }

    return results;
}

bool PathValidator::isSafePath(const std::string& path) const {
    return validatePath(path).isSuccess();
}

Result<std::string> PathValidator::getRelativePath(const std::string& path) const {
    auto validated = validatePath(path);
    if (!validated.isSuccess()) {
        return validated;
    }

    const fs::path target(validated.value());
    for (const auto& root : allowedRoots_) {
        if (auto rel = relativeInside(root, target)) {
            return Result<std::string>(rel->empty() ? std::string(".") : rel->string());
        }
    }

    // Fall back to the working directory
    return Result<std::string>(target.lexically_relative(fs::current_path()).string());
}

PathValidator PathValidator::withAdditionalRoots(const std::vector<std::string>& roots) const {
    PathValidatorOptions extended = options_;
    extended.allowedRoots.insert(extended.allowedRoots.end(), roots.begin(), roots.end());
    return PathValidator(extended);
}

bool PathValidator::containsNullBytes(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

bool PathValidator::isPathLengthValid(const std::string& path) const {
    return path.length() <= options_.maxPathLength;
}

fs::path PathValidator::normalizePath(const std::string& path) {
    fs::path normalized = fs::absolute(fs::path(path)).lexically_normal();
    // "/a/b/" and "/a/b" must compare equal against a root
    if (normalized.has_relative_path() && normalized.filename().empty()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

std::optional<fs::path> PathValidator::relativeInside(const fs::path& root, const fs::path& target) {
    if (target == root) {
        return fs::path();
    }

    const fs::path rel = target.lexically_relative(root);
    if (rel.empty() || rel.is_absolute()) {
        return std::nullopt;
    }

    const auto first = *rel.begin();
    if (first == "..") {
        return std::nullopt;
    }
    if (first == ".") {
        return fs::path();
    }
    return rel;
}

bool PathValidator::isWithinAllowedRoot(const fs::path& target) const {
    return std::any_of(allowedRoots_.begin(), allowedRoots_.end(), [&target](const fs::path& root) {
        return relativeInside(root, target).has_value();
    });
}

} // namespace Kalkan::Core
