#ifndef SOURCESCANNER_HPP
#define SOURCESCANNER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "../parser/sandboxedparser.hpp"

namespace Kalkan::Core {

struct ScanReport {
    std::vector<std::string> files;
    std::vector<std::string> unreadableDirectories;
    BatchParseResult parsed;
};

/**
 * @brief Finds JavaScript and TypeScript sources under a root and parses them
 *
 * Every directory entered is recorded with the parser's limiter, so
 * directory depth and count ceilings abort the walk. Symbolic links are
 * not followed.
 */
class SourceScanner {
public:
    explicit SourceScanner(SandboxedParser& parser);

    /**
     * @brief Lists source files below a root
     * @param root Directory, normally already validated by a PathValidator
     * @throws SecurityException when a directory ceiling is crossed
     */
    std::vector<std::string> findSourceFiles(const std::string& root);

    /**
     * @brief Lists and parses; per-file failures end up in ScanReport::parsed.errors
     */
    ScanReport scan(const std::string& root);

    /**
     * @brief Directory names skipped during a walk
     *
     * node_modules and .git, plus the plain directory names listed in a
     * .gitignore at the root.
     */
    static std::set<std::string> excludedDirectories(const std::string& root);

    static bool isSourceFile(const std::filesystem::path& path);

private:
    SandboxedParser& parser_;

    void walk(const std::filesystem::path& directory, int depth,
              const std::set<std::string>& excluded, ScanReport& report);
};

} // namespace Kalkan::Core

#endif // SOURCESCANNER_HPP
