#ifndef PATHVALIDATOR_HPP
#define PATHVALIDATOR_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "errors/securityerror.hpp"

namespace Kalkan::Core {

/**
 * @brief Configuration of a PathValidator
 */
struct PathValidatorOptions {
    // Roots every validated path must stay within. Empty means the
    // current working directory at construction time.
    std::vector<std::string> allowedRoots;
    std::size_t maxPathLength = 4096;
    bool resolveSymlinks = true;
    bool requireExists = false;
};

/**
 * @brief Per-call overrides for validatePath
 */
struct ValidateOptions {
    bool requireExists = false;
};

/**
 * @brief A validated path together with what stat could tell about it
 */
struct PathMetadata {
    std::string originalPath;
    std::string validatedPath;
    bool exists = false;
    bool isDirectory = false;
    bool isFile = false;
    std::optional<std::uint64_t> size;
    std::string statError;
};

/**
 * @brief Outcome of a batch validation
 */
struct PathBatchResult {
    struct Entry {
        std::string original;
        std::string validated;
    };
    struct Failure {
        std::string path;
        SecurityError error;
    };

    std::vector<Entry> valid;
    std::vector<std::string> invalid;
    std::vector<Failure> errors;
};

/**
 * @brief Validates file system paths against a set of allowed roots
 */
class PathValidator {
public:
    explicit PathValidator(PathValidatorOptions options = PathValidatorOptions());

    /**
     * @brief Validates a path and resolves it to absolute form
     * @param path The path to validate, relative to the working directory or absolute
     * @param options Per-call overrides
     * @return Result containing the absolute normalized path if it lies inside an allowed root
     */
    Result<std::string> validatePath(const std::string& path, const ValidateOptions& options = ValidateOptions()) const;

    /**
     * @brief Validates a path and reports existence, type and size
     *
     * Stat failures are recorded in PathMetadata::statError instead of
     * failing the call.
     */
    Result<PathMetadata> validatePathWithMetadata(const std::string& path,
                                                  const ValidateOptions& options = ValidateOptions()) const;

    /**
     * @brief Validates every path of a batch without stopping at the first failure
     */
    PathBatchResult validatePaths(const std::vector<std::string>& paths,
                                  const ValidateOptions& options = ValidateOptions()) const;

    /**
     * @brief Non-throwing probe
     * @return true if validatePath would succeed
     */
    bool isSafePath(const std::string& path) const;

    /**
     * @brief Returns the path relative to the allowed root containing it
     * @return "." for a root itself
     */
    Result<std::string> getRelativePath(const std::string& path) const;

    /**
     * @brief Derives a validator that also accepts the given roots
     */
    PathValidator withAdditionalRoots(const std::vector<std::string>& roots) const;

    const std::vector<std::filesystem::path>& allowedRoots() const { return allowedRoots_; }
    const PathValidatorOptions& options() const { return options_; }

private:
    PathValidatorOptions options_;
    std::vector<std::filesystem::path> allowedRoots_;

    static bool containsNullBytes(const std::string& path);
    static std::filesystem::path normalizePath(const std::string& path);
    static std::optional<std::filesystem::path> relativeInside(const std::filesystem::path& root,
                                                               const std::filesystem::path& target);
    bool isPathLengthValid(const std::string& path) const;
    bool isWithinAllowedRoot(const std::filesystem::path& target) const;
};

} // namespace Kalkan::Core

#endif // PATHVALIDATOR_HPP
