#ifndef SECURITYCONTEXT_HPP
#define SECURITYCONTEXT_HPP

#include <QJsonObject>
#include <QVariantMap>

#include <memory>

#include "config/securityconfig.hpp"
#include "inputsanitizer.hpp"
#include "limits/resourcelimiter.hpp"
#include "parser/sandboxedparser.hpp"
#include "pathvalidator.hpp"

namespace Kalkan::Core {

/**
 * @brief Owns one instance of every gate and wires them together
 *
 * Construct once per host and pass it to whoever needs it. The parser
 * shares this context's limiter, so file, byte and operation counters
 * are global to the context.
 */
class SecurityContext {
public:
    explicit SecurityContext(const SecurityConfig& config = SecurityConfig(),
                             std::shared_ptr<const SourceGrammar> grammar = nullptr);
    ~SecurityContext();

    SecurityContext(const SecurityContext&) = delete;
    SecurityContext& operator=(const SecurityContext&) = delete;

    /**
     * @brief Sanitizes an analyze request and resolves its root directory
     * @param params Raw parameter bag
     * @return Sanitized parameters with rootDir replaced by its absolute, existing form
     * @throws SecurityException on the first violation
     */
    AnalyzeParams validateAndSanitize(const QVariantMap& params) const;

    /**
     * @brief Limiter usage, parser counters and an ISO-8601 timestamp
     */
    QJsonObject securityStats() const;

    void reset();

    /**
     * @brief Stops background work of every component; idempotent
     */
    void destroy();

    const PathValidator& pathValidator() const { return pathValidator_; }
    const InputSanitizer& inputSanitizer() const { return inputSanitizer_; }
    ResourceLimiter& resourceLimiter() { return resourceLimiter_; }
    const ResourceLimiter& resourceLimiter() const { return resourceLimiter_; }
    SandboxedParser& sandboxedParser() { return sandboxedParser_; }
    const SandboxedParser& sandboxedParser() const { return sandboxedParser_; }

private:
    PathValidator pathValidator_;
    InputSanitizer inputSanitizer_;
    ResourceLimiter resourceLimiter_;
    SandboxedParser sandboxedParser_;
};

} // namespace Kalkan::Core

#endif // SECURITYCONTEXT_HPP
