#ifndef SANDBOXEDPARSER_HPP
#define SANDBOXEDPARSER_HPP

#include <QJsonObject>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../errors/securityerror.hpp"
#include "../limits/resourcelimiter.hpp"
#include "../syntaxnode.hpp"
#include "sourcegrammar.hpp"

class QThreadPool;

namespace Kalkan::Core {

struct ParserOptions {
    std::chrono::milliseconds parseTimeout{5000};
    std::size_t maxLineLength = 10000;
    bool useWorkerThreads = false;
    int maxWorkers = 2;
};

struct ParseOptions {
    // Treat the input as in-memory text even when the path exists on disk
    bool forceInMemory = false;
};

struct ParseMetadata {
    std::string filePath;
    double parseTimeMs = 0.0;
    TreeStats treeStats;
    std::string sourceKind;
    bool isInMemory = false;
    bool permissiveRetry = false;

    QJsonObject toJson() const;
};

/**
 * @brief Parsed tree plus metadata, owned by the caller
 *
 * `findings` lists suspicious constructs seen in the source. They are
 * informational and never block a parse.
 */
struct ParseResult {
    std::unique_ptr<SyntaxNode> tree;
    ParseMetadata metadata;
    std::vector<std::string> findings;
};

struct BatchParseResult {
    struct Failure {
        std::string path;
        SecurityError error;
    };

    std::vector<ParseResult> results;
    std::vector<Failure> errors;
};

struct ParserStats {
    std::uint64_t filesParsed = 0;
    std::uint64_t failures = 0;
    std::uint64_t timeouts = 0;
    std::uint64_t permissiveRetries = 0;
    std::uint64_t bytesParsed = 0;
    double totalParseTimeMs = 0.0;

    QJsonObject toJson() const;
};

/**
 * @brief Wraps a SourceGrammar with size, safety, deadline and structure checks
 *
 * Every call is admitted through the ResourceLimiter and released on all
 * exit paths. Failures are raised as ParserException.
 */
class SandboxedParser {
public:
    /**
     * @param limiter Shared ledger; must outlive the parser
     * @param options Parser settings
     * @param grammar Grammar to run; JsxGrammar when null
     */
    explicit SandboxedParser(ResourceLimiter& limiter,
                             ParserOptions options = ParserOptions(),
                             std::shared_ptr<const SourceGrammar> grammar = nullptr);
    ~SandboxedParser();

    SandboxedParser(const SandboxedParser&) = delete;
    SandboxedParser& operator=(const SandboxedParser&) = delete;

    /**
     * @brief Parses source text under every configured ceiling
     * @param filePath Path on disk, or a virtual name for in-memory text
     * @param code Source text
     * @param options Per-call options
     * @return Tree and metadata
     */
    ParseResult parseFile(const std::string& filePath, const std::string& code,
                          const ParseOptions& options = ParseOptions());

    /**
     * @brief Reads and parses each file; per-file failures are collected, not thrown
     */
    BatchParseResult parseMultipleFiles(const std::vector<std::string>& paths);

    ParserStats stats() const;
    void reset();

    /**
     * @brief Waits for worker threads to finish; idempotent
     */
    void destroy();

    const ParserOptions& options() const { return options_; }
    ResourceLimiter& limiter() const { return limiter_; }

    static std::string sourceKindFor(const std::string& filePath);

private:
    ResourceLimiter& limiter_;
    const ParserOptions options_;
    std::shared_ptr<const SourceGrammar> grammar_;
    std::unique_ptr<QThreadPool> pool_;

    mutable std::mutex statsMutex_;
    ParserStats stats_;

    std::vector<std::string> checkCodeSafety(const std::string& code, const std::string& filePath) const;
    std::unique_ptr<SyntaxNode> parseWithDeadline(const std::string& code,
                                                  const std::string& filePath,
                                                  bool& permissiveRetry);
    std::unique_ptr<SyntaxNode> runGrammar(const std::string& code,
                                           GrammarMode mode,
                                           const std::shared_ptr<CancellationToken>& token);
    void recordFailure(bool timedOut);
};

} // namespace Kalkan::Core

#endif // SANDBOXEDPARSER_HPP
