#include "securitycontext.hpp"
#include "logging.hpp"

#include <QDateTime>

namespace Kalkan::Core {

SecurityContext::SecurityContext(const SecurityConfig& config, std::shared_ptr<const SourceGrammar> grammar)
    : pathValidator_(config.pathValidator)
    , inputSanitizer_(config.inputSanitizer)
    , resourceLimiter_(config.resourceLimiter)
    , sandboxedParser_(resourceLimiter_, config.sandboxedParser, std::move(grammar))
{
    qCDebug(lcContext) << "Security context created with" << pathValidator_.allowedRoots().size() << "allowed roots";
}

SecurityContext::~SecurityContext()
{
    destroy();
}

AnalyzeParams SecurityContext::validateAndSanitize(const QVariantMap& params) const
{
    AnalyzeParams sanitized = inputSanitizer_.sanitizeAnalyzeParams(params).value();

    ValidateOptions options;
    options.requireExists = true;
    const Result<std::string> rootDir = pathValidator_.validatePath(sanitized.rootDir.toStdString(), options);
    if (rootDir.isError()) {
        qCWarning(lcContext) << "Rejected root directory:" << rootDir.error().describe().c_str();
        throw SecurityException(rootDir.error());
    }

    sanitized.rootDir = QString::fromStdString(rootDir.value());
    return sanitized;
}

QJsonObject SecurityContext::securityStats() const
{
    return QJsonObject{
        {QStringLiteral("resourceUsage"), resourceLimiter_.usageStats().toJson()},
        {QStringLiteral("parserStats"), sandboxedParser_.stats().toJson()},
        {QStringLiteral("timestamp"), QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)},
    };
}

void SecurityContext::reset()
{
    resourceLimiter_.reset();
    sandboxedParser_.reset();
}

void SecurityContext::destroy()
{
    // Reverse order of construction
    sandboxedParser_.destroy();
    resourceLimiter_.destroy();
}

} // namespace Kalkan::Core
