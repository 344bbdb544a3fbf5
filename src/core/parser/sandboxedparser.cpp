#include "sandboxedparser.hpp"
#include "jsxgrammar.hpp"
#include "../logging.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <QThreadPool>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>

namespace Kalkan::Core {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

struct SuspiciousPattern {
    const char* label;
    QRegularExpression regex;
};

const std::vector<SuspiciousPattern>& suspiciousPatterns()
{
    static const std::vector<SuspiciousPattern> patterns = {
        {"eval(", QRegularExpression(QStringLiteral(R"(eval\s*\()"))},
        {"Function(", QRegularExpression(QStringLiteral(R"(Function\s*\()"))},
        {"new Function", QRegularExpression(QStringLiteral(R"(new\s+Function)"))},
        {"setTimeout(", QRegularExpression(QStringLiteral(R"(setTimeout\s*\()"))},
        {"setInterval(", QRegularExpression(QStringLiteral(R"(setInterval\s*\()"))},
        {".constructor", QRegularExpression(QStringLiteral(R"(\.\s*constructor)"))},
        {"__proto__", QRegularExpression(QStringLiteral("__proto__"))},
        {"require(", QRegularExpression(QStringLiteral(R"(require\s*\()"))},
        {"import(", QRegularExpression(QStringLiteral(R"(import\s*\()"))},
        {"process.", QRegularExpression(QStringLiteral(R"(process\.)"))},
        {"global.", QRegularExpression(QStringLiteral(R"(global\.)"))},
        {"window.", QRegularExpression(QStringLiteral(R"(window\.)"))},
        {"document.", QRegularExpression(QStringLiteral(R"(document\.)"))},
    };
    return patterns;
}

double elapsedMs(Clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace

QJsonObject ParseMetadata::toJson() const
{
    return QJsonObject{
        {QStringLiteral("filePath"), QString::fromStdString(filePath)},
        {QStringLiteral("parseTimeMs"), parseTimeMs},
        {QStringLiteral("treeStats"), QJsonObject{
            {QStringLiteral("nodeCount"), static_cast<qint64>(treeStats.nodeCount)},
            {QStringLiteral("maxDepth"), treeStats.maxDepth},
        }},
        {QStringLiteral("sourceKind"), QString::fromStdString(sourceKind)},
        {QStringLiteral("isInMemory"), isInMemory},
        {QStringLiteral("permissiveRetry"), permissiveRetry},
    };
}

QJsonObject ParserStats::toJson() const
{
    return QJsonObject{
        {QStringLiteral("filesParsed"), static_cast<qint64>(filesParsed)},
        {QStringLiteral("failures"), static_cast<qint64>(failures)},
        {QStringLiteral("timeouts"), static_cast<qint64>(timeouts)},
        {QStringLiteral("permissiveRetries"), static_cast<qint64>(permissiveRetries)},
        {QStringLiteral("bytesParsed"), static_cast<qint64>(bytesParsed)},
        {QStringLiteral("totalParseTimeMs"), totalParseTimeMs},
    };
}

SandboxedParser::SandboxedParser(ResourceLimiter& limiter, ParserOptions options,
                                 std::shared_ptr<const SourceGrammar> grammar)
    : limiter_(limiter)
    , options_(options)
    , grammar_(grammar ? std::move(grammar) : std::make_shared<JsxGrammar>())
{
    if (options_.useWorkerThreads) {
        pool_ = std::make_unique<QThreadPool>();
        pool_->setMaxThreadCount(std::max(1, options_.maxWorkers));
    }
}

SandboxedParser::~SandboxedParser()
{
    destroy();
}

std::string SandboxedParser::sourceKindFor(const std::string& filePath)
{
    const std::string extension = fs::path(filePath).extension().string();
    if (extension == ".ts" || extension == ".tsx") {
        return "typescript";
    }
    return "javascript";
}

ParseResult SandboxedParser::parseFile(const std::string& filePath, const std::string& code,
                                       const ParseOptions& parseOptions)
{
    OperationGuard guard(limiter_);
    const auto startTime = Clock::now();

    try {
        std::error_code ec;
        const bool inMemory = parseOptions.forceInMemory || !fs::exists(filePath, ec);

        if (!inMemory) {
            limiter_.checkFileSize(filePath);
        } else if (code.size() > limiter_.limits().maxFileSize) {
            SecurityError error(ErrorKind::ResourceExceeded, "CODE_TOO_LARGE",
                                "Code size " + std::to_string(code.size()) + " bytes exceeds maximum allowed "
                                    + std::to_string(limiter_.limits().maxFileSize) + " bytes",
                                filePath);
            error.withLimit(static_cast<std::int64_t>(limiter_.limits().maxFileSize),
                            static_cast<std::int64_t>(code.size()));
            throw SecurityException(error);
        }

        ParseResult result;
        result.findings = checkCodeSafety(code, filePath);

        bool permissiveRetry = false;
        result.tree = parseWithDeadline(code, filePath, permissiveRetry);

        const TreeStats treeStats = limiter_.validateTree(*result.tree);
        limiter_.recordFileProcessed(filePath, code.size());

        result.metadata.filePath = filePath;
        result.metadata.parseTimeMs = elapsedMs(startTime);
        result.metadata.treeStats = treeStats;
        result.metadata.sourceKind = sourceKindFor(filePath);
        result.metadata.isInMemory = inMemory;
        result.metadata.permissiveRetry = permissiveRetry;

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            ++stats_.filesParsed;
            stats_.bytesParsed += code.size();
            stats_.totalParseTimeMs += result.metadata.parseTimeMs;
            if (permissiveRetry) {
                ++stats_.permissiveRetries;
            }
        }

        qCDebug(lcParser) << "Parsed" << filePath.c_str() << "nodes:" << treeStats.nodeCount
                          << "time:" << result.metadata.parseTimeMs << "ms";
        return result;
    } catch (const ParserException& e) {
        recordFailure(false);
        qCWarning(lcParser) << e.what();
        throw;
    } catch (const SecurityException& e) {
        recordFailure(false);
        qCWarning(lcParser) << "Resource limit exceeded while parsing" << filePath.c_str() << e.what();
        throw ParserException(SecurityError(e.kind(), "RESOURCE_LIMIT_EXCEEDED",
                                            "Resource limit exceeded while parsing " + filePath + ": " + e.error().message,
                                            filePath),
                              filePath, e.error());
    } catch (const ParseCancelled&) {
        recordFailure(true);
        qCWarning(lcParser) << "Parse of" << filePath.c_str() << "timed out";
        SecurityError error(ErrorKind::Timeout, "PARSE_TIMEOUT",
                            "Parsing timeout after " + std::to_string(options_.parseTimeout.count()) + "ms",
                            filePath);
        error.withLimit(options_.parseTimeout.count(), static_cast<std::int64_t>(elapsedMs(startTime)));
        throw ParserException(error, filePath);
    }
}

std::vector<std::string> SandboxedParser::checkCodeSafety(const std::string& code, const std::string& filePath) const
{
    if (code.find('\0') != std::string::npos) {
        throw ParserException(SecurityError(ErrorKind::ParseFailure, "NULL_BYTES_DETECTED",
                                            "Code contains null bytes", filePath),
                              filePath);
    }

    std::size_t lineStart = 0;
    std::size_t lineNumber = 1;
    while (lineStart <= code.size()) {
        std::size_t lineEnd = code.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = code.size();
        }
        const std::size_t length = lineEnd - lineStart;
        if (length > options_.maxLineLength) {
            SecurityError error(ErrorKind::ParseFailure, "LINE_TOO_LONG",
                                "Line " + std::to_string(lineNumber) + " exceeds maximum length of "
                                    + std::to_string(options_.maxLineLength) + " characters",
                                filePath);
            error.withLimit(static_cast<std::int64_t>(options_.maxLineLength), static_cast<std::int64_t>(length));
            throw ParserException(error, filePath);
        }
        lineStart = lineEnd + 1;
        ++lineNumber;
    }

    std::vector<std::string> findings;
    const QString text = QString::fromStdString(code);
    for (const auto& pattern : suspiciousPatterns()) {
        if (pattern.regex.match(text).hasMatch()) {
            findings.emplace_back(pattern.label);
        }
    }

    if (!findings.empty()) {
        QStringList labels;
        for (const auto& finding : findings) {
            labels << QString::fromStdString(finding);
        }
        qCInfo(lcParser) << "Suspicious constructs in" << filePath.c_str() << ":" << labels.join(QStringLiteral(", "));
    }
    return findings;
}

std::unique_ptr<SyntaxNode> SandboxedParser::parseWithDeadline(const std::string& code,
                                                               const std::string& filePath,
                                                               bool& permissiveRetry)
{
    // One deadline covers the strict attempt and the permissive retry
    auto token = std::make_shared<CancellationToken>(Clock::now() + options_.parseTimeout);

    try {
        return runGrammar(code, GrammarMode::Strict, token);
    } catch (const GrammarError& e) {
        if (!e.isRecoverable()) {
            throw ParserException(SecurityError(ErrorKind::ParseFailure, "PARSE_FAILED",
                                                std::string("Parse failed: ") + e.what(), filePath),
                                  filePath);
        }
        qCInfo(lcParser) << "Retrying" << filePath.c_str() << "in permissive mode:" << e.what();
    }

    permissiveRetry = true;
    try {
        return runGrammar(code, GrammarMode::Permissive, token);
    } catch (const GrammarError& e) {
        throw ParserException(SecurityError(ErrorKind::ParseFailure, "PARSE_FAILED_RETRY",
                                            std::string("Parse failed even with permissive settings: ") + e.what(),
                                            filePath),
                              filePath);
    }
}

std::unique_ptr<SyntaxNode> SandboxedParser::runGrammar(const std::string& code,
                                                        GrammarMode mode,
                                                        const std::shared_ptr<CancellationToken>& token)
{
    std::unique_ptr<SyntaxNode> tree;

    if (!pool_) {
        tree = grammar_->parse(code, mode, *token);
    } else {
        // The worker may outlive this call after a timeout, so it owns copies of its inputs
        auto promise = std::make_shared<std::promise<std::unique_ptr<SyntaxNode>>>();
        auto future = promise->get_future();
        auto source = std::make_shared<const std::string>(code);

        pool_->start([grammar = grammar_, source, mode, token, promise]() {
            try {
                promise->set_value(grammar->parse(*source, mode, *token));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        if (future.wait_until(token->deadline()) == std::future_status::timeout) {
            token->cancel();
            throw ParseCancelled();
        }
        tree = future.get();
    }

    // A result finished after the deadline is discarded
    if (token->isCancelled()) {
        throw ParseCancelled();
    }
    return tree;
}

BatchParseResult SandboxedParser::parseMultipleFiles(const std::vector<std::string>& paths)
{
    BatchParseResult batch;

    for (const auto& path : paths) {
        try {
            // Size check first so an oversized file is never read into memory
            limiter_.checkFileSize(path);

            std::ifstream file(path, std::ios::binary);
            if (!file) {
                throw SecurityException(ErrorKind::InvalidInput, "FILE_READ_ERROR", "Cannot open file for reading", path);
            }
            std::ostringstream content;
            content << file.rdbuf();
            if (file.bad()) {
                throw SecurityException(ErrorKind::InvalidInput, "FILE_READ_ERROR", "Failed to read file", path);
            }

            batch.results.push_back(parseFile(path, content.str()));
        } catch (const SecurityException& e) {
            batch.errors.push_back({path, e.error()});
        }
    }

    qCDebug(lcParser) << "Batch parsed" << batch.results.size() << "files," << batch.errors.size() << "failed";
    return batch;
}

ParserStats SandboxedParser::stats() const
{
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void SandboxedParser::reset()
{
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = ParserStats();
}

void SandboxedParser::destroy()
{
    if (pool_) {
        pool_->waitForDone();
    }
}

void SandboxedParser::recordFailure(bool timedOut)
{
    std::lock_guard<std::mutex> lock(statsMutex_);
    ++stats_.failures;
    if (timedOut) {
        ++stats_.timeouts;
    }
}

} // namespace Kalkan::Core
