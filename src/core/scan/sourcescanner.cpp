#include "sourcescanner.hpp"
#include "../logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace Kalkan::Core {

namespace fs = std::filesystem;

SourceScanner::SourceScanner(SandboxedParser& parser)
    : parser_(parser)
{
}

std::set<std::string> SourceScanner::excludedDirectories(const std::string& root)
{
    std::set<std::string> excluded = {"node_modules", ".git"};

    std::ifstream gitignore(fs::path(root) / ".gitignore");
    if (!gitignore) {
        return excluded;
    }

    std::string line;
    while (std::getline(gitignore, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        std::string entry = line.substr(first, last - first + 1);

        if (!entry.empty() && entry.back() == '/') {
            entry.pop_back();
        }
        if (!entry.empty() && entry.front() == '/') {
            entry.erase(0, 1);
        }
        // Wildcards are not supported, keep the literal prefix
        const auto wildcard = entry.find_first_of("*\\");
        if (wildcard != std::string::npos) {
            entry.erase(wildcard);
        }
        if (!entry.empty()) {
            excluded.insert(entry);
        }
    }
    return excluded;
}

bool SourceScanner::isSourceFile(const fs::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".js" || extension == ".jsx" || extension == ".ts" || extension == ".tsx";
}

std::vector<std::string> SourceScanner::findSourceFiles(const std::string& root)
{
    ScanReport report;
    walk(fs::path(root), 0, excludedDirectories(root), report);
    return report.files;
}

ScanReport SourceScanner::scan(const std::string& root)
{
    ScanReport report;
    walk(fs::path(root), 0, excludedDirectories(root), report);

    qCInfo(lcScanner) << "Found" << report.files.size() << "source files under" << root.c_str();
    report.parsed = parser_.parseMultipleFiles(report.files);
    return report;
}

void SourceScanner::walk(const fs::path& directory, int depth,
                         const std::set<std::string>& excluded, ScanReport& report)
{
    parser_.limiter().trackDirectoryTraversal(directory.string(), depth);

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        qCWarning(lcScanner) << "Could not read directory" << directory.c_str() << ":" << ec.message().c_str();
        report.unreadableDirectories.push_back(directory.string());
        return;
    }

    std::vector<fs::directory_entry> entries;
    const fs::directory_iterator end;
    while (it != end) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            qCWarning(lcScanner) << "Stopped reading" << directory.c_str() << ":" << ec.message().c_str();
            report.unreadableDirectories.push_back(directory.string());
            break;
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        const fs::file_status status = entry.symlink_status(ec);
        if (ec || fs::is_symlink(status)) {
            continue;
        }

        if (fs::is_directory(status)) {
            if (excluded.count(entry.path().filename().string()) == 0) {
                walk(entry.path(), depth + 1, excluded, report);
            }
        } else if (fs::is_regular_file(status) && isSourceFile(entry.path())) {
            report.files.push_back(entry.path().string());
        }
    }
}

} // namespace Kalkan::Core
