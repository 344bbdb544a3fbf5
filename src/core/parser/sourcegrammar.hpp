#ifndef SOURCEGRAMMAR_HPP
#define SOURCEGRAMMAR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "../syntaxnode.hpp"

namespace Kalkan::Core {

enum class GrammarMode {
    Strict,
    Permissive
};

/**
 * @brief Deadline plus an explicit cancel flag, polled by grammars
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    explicit CancellationToken(Clock::time_point deadline = Clock::time_point::max())
        : deadline_(deadline) {}

    void cancel() { cancelled_.store(true); }

    bool isCancelled() const
    {
        return cancelled_.load() || Clock::now() >= deadline_;
    }

    Clock::time_point deadline() const { return deadline_; }

private:
    Clock::time_point deadline_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Syntax error reported by a grammar
 *
 * Recoverable errors are strict-mode violations that a permissive parse
 * may accept.
 */
class GrammarError : public std::runtime_error {
public:
    GrammarError(const std::string& message, bool recoverable, std::uint32_t line, std::uint32_t column)
        : std::runtime_error(message + " (" + std::to_string(line) + ":" + std::to_string(column) + ")")
        , recoverable_(recoverable)
        , line_(line)
        , column_(column) {}

    bool isRecoverable() const { return recoverable_; }
    std::uint32_t line() const { return line_; }
    std::uint32_t column() const { return column_; }

private:
    bool recoverable_;
    std::uint32_t line_;
    std::uint32_t column_;
};

/**
 * @brief Thrown by a grammar that observed its token being cancelled
 */
class ParseCancelled : public std::runtime_error {
public:
    ParseCancelled() : std::runtime_error("Parse cancelled") {}
};

/**
 * @brief Source-to-syntax-tree transformation wrapped by the sandboxed parser
 *
 * Implementations must poll the token often enough for a deadline to stop
 * them promptly, and must be safe to call from several threads at once.
 */
class SourceGrammar {
public:
    virtual ~SourceGrammar() = default;

    virtual std::unique_ptr<SyntaxNode> parse(const std::string& source,
                                              GrammarMode mode,
                                              const CancellationToken& token) const = 0;

    virtual std::string name() const = 0;
};

} // namespace Kalkan::Core

#endif // SOURCEGRAMMAR_HPP
