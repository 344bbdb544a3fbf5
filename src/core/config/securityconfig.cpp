#include "securityconfig.hpp"
#include "../logging.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QRegularExpression>

#include <cmath>
#include <limits>
#include <string>

namespace Kalkan::Core {

namespace {

// Deadlines are computed as steady_clock::now() + duration, which has to
// stay representable in nanoseconds
constexpr std::int64_t kMaxMilliseconds = 24ll * 60 * 60 * 1000;

/**
 * @brief Typed accessors over one section of the configuration document
 *
 * Each accessor leaves the target untouched when the key is absent and
 * throws SecurityException when it is present with the wrong type or range.
 */
class SectionReader {
public:
    SectionReader(const QJsonObject& root, const QString& name)
        : name_(name)
    {
        const QJsonValue value = root.value(name);
        if (value.isUndefined()) {
            return;
        }
        if (!value.isObject()) {
            throw SecurityException(ErrorKind::InvalidInput, "INVALID_CONFIG",
                                    "Configuration section must be an object", name.toStdString());
        }
        section_ = value.toObject();
    }

    template<typename T>
    void positive(const char* key, T& target) const
    {
        const QJsonValue value = section_.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        const double number = value.toDouble();
        if (!value.isDouble() || number <= 0 || std::floor(number) != number
            || number >= std::ldexp(1.0, std::numeric_limits<T>::digits)) {
            fail(key, "must be a positive integer");
        }
        target = static_cast<T>(number);
    }

    void milliseconds(const char* key, std::chrono::milliseconds& target) const
    {
        std::int64_t count = target.count();
        positive(key, count);
        if (count > kMaxMilliseconds) {
            fail(key, "must not exceed " + std::to_string(kMaxMilliseconds) + " milliseconds");
        }
        target = std::chrono::milliseconds(count);
    }

    void boolean(const char* key, bool& target) const
    {
        const QJsonValue value = section_.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isBool()) {
            fail(key, "must be a boolean");
        }
        target = value.toBool();
    }

    void pattern(const char* key, QString& target) const
    {
        const QJsonValue value = section_.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isString()) {
            fail(key, "must be a string");
        }
        const QRegularExpression regex(value.toString());
        if (!regex.isValid()) {
            fail(key, "is not a valid regular expression: " + regex.errorString().toStdString());
        }
        target = value.toString();
    }

    void stringList(const char* key, std::vector<std::string>& target) const
    {
        const QJsonValue value = section_.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isArray()) {
            fail(key, "must be an array of strings");
        }
        std::vector<std::string> items;
        const QJsonArray array = value.toArray();
        for (const QJsonValue& item : array) {
            if (!item.isString() || item.toString().isEmpty()) {
                fail(key, "must be an array of non-empty strings");
            }
            items.push_back(item.toString().toStdString());
        }
        target = std::move(items);
    }

private:
    QString name_;
    QJsonObject section_;

    [[noreturn]] void fail(const char* key, const std::string& message) const
    {
        const std::string context = name_.toStdString() + "." + key;
        throw SecurityException(ErrorKind::InvalidInput, "INVALID_CONFIG", context + " " + message, context);
    }
};

} // namespace

Result<SecurityConfig> SecurityConfig::fromJson(const QJsonObject& root)
{
    SecurityConfig config;

    try {
        const SectionReader paths(root, QStringLiteral("pathValidator"));
        paths.stringList("allowedRoots", config.pathValidator.allowedRoots);
        paths.positive("maxPathLength", config.pathValidator.maxPathLength);
        paths.boolean("resolveSymlinks", config.pathValidator.resolveSymlinks);
        paths.boolean("requireExists", config.pathValidator.requireExists);

        const SectionReader sanitizer(root, QStringLiteral("inputSanitizer"));
        sanitizer.positive("maxStringLength", config.inputSanitizer.maxStringLength);
        sanitizer.positive("maxArrayLength", config.inputSanitizer.maxArrayLength);
        sanitizer.positive("maxNestingDepth", config.inputSanitizer.maxNestingDepth);
        sanitizer.pattern("componentNamePattern", config.inputSanitizer.componentNamePattern);
        sanitizer.pattern("propNamePattern", config.inputSanitizer.propNamePattern);
        sanitizer.pattern("searchValuePattern", config.inputSanitizer.searchValuePattern);

        ResourceLimits& limits = config.resourceLimiter;
        const SectionReader limiter(root, QStringLiteral("resourceLimiter"));
        limiter.positive("maxFileSize", limits.maxFileSize);
        limiter.positive("maxTotalFileSize", limits.maxTotalFileSize);
        limiter.milliseconds("maxProcessingTime", limits.maxProcessingTime);
        limiter.positive("maxFileCount", limits.maxFileCount);
        limiter.positive("maxConcurrentOperations", limits.maxConcurrentOperations);
        limiter.positive("maxMemoryUsage", limits.maxMemoryUsage);
        limiter.milliseconds("memoryCheckInterval", limits.memoryCheckInterval);
        limiter.boolean("monitorMemory", limits.monitorMemory);
        limiter.positive("maxASTDepth", limits.maxASTDepth);
        limiter.positive("maxASTNodes", limits.maxASTNodes);
        limiter.positive("maxDirectoryDepth", limits.maxDirectoryDepth);
        limiter.positive("maxDirectoriesScanned", limits.maxDirectoriesScanned);

        const SectionReader parser(root, QStringLiteral("sandboxedParser"));
        parser.milliseconds("parseTimeout", config.sandboxedParser.parseTimeout);
        parser.positive("maxLineLength", config.sandboxedParser.maxLineLength);
        parser.boolean("useWorkerThreads", config.sandboxedParser.useWorkerThreads);
        parser.positive("maxWorkers", config.sandboxedParser.maxWorkers);
    } catch (const SecurityException& e) {
        qCWarning(lcContext) << "Rejected configuration:" << e.what();
        return e.error();
    }

    return config;
}

Result<SecurityConfig> SecurityConfig::loadFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return SecurityError(ErrorKind::InvalidInput, "CONFIG_READ_ERROR",
                             "Cannot open configuration file: " + file.errorString().toStdString(),
                             path.toStdString());
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return SecurityError(ErrorKind::InvalidInput, "INVALID_CONFIG_JSON",
                             "Configuration is not valid JSON: " + parseError.errorString().toStdString()
                                 + " at offset " + std::to_string(parseError.offset),
                             path.toStdString());
    }
    if (!document.isObject()) {
        return SecurityError(ErrorKind::InvalidInput, "INVALID_CONFIG_JSON",
                             "Configuration root must be a JSON object", path.toStdString());
    }

    qCDebug(lcContext) << "Loaded configuration from" << path;
    return fromJson(document.object());
}

QJsonObject SecurityConfig::toJson() const
{
    QJsonArray roots;
    for (const auto& root : pathValidator.allowedRoots) {
        roots.append(QString::fromStdString(root));
    }

    return QJsonObject{
        {QStringLiteral("pathValidator"), QJsonObject{
            {QStringLiteral("allowedRoots"), roots},
            {QStringLiteral("maxPathLength"), static_cast<qint64>(pathValidator.maxPathLength)},
            {QStringLiteral("resolveSymlinks"), pathValidator.resolveSymlinks},
            {QStringLiteral("requireExists"), pathValidator.requireExists},
        }},
        {QStringLiteral("inputSanitizer"), QJsonObject{
            {QStringLiteral("maxStringLength"), inputSanitizer.maxStringLength},
            {QStringLiteral("maxArrayLength"), inputSanitizer.maxArrayLength},
            {QStringLiteral("maxNestingDepth"), inputSanitizer.maxNestingDepth},
        }},
        {QStringLiteral("resourceLimiter"), QJsonObject{
            {QStringLiteral("maxFileSize"), static_cast<qint64>(resourceLimiter.maxFileSize)},
            {QStringLiteral("maxTotalFileSize"), static_cast<qint64>(resourceLimiter.maxTotalFileSize)},
            {QStringLiteral("maxProcessingTime"), static_cast<qint64>(resourceLimiter.maxProcessingTime.count())},
            {QStringLiteral("maxFileCount"), static_cast<qint64>(resourceLimiter.maxFileCount)},
            {QStringLiteral("maxConcurrentOperations"), static_cast<qint64>(resourceLimiter.maxConcurrentOperations)},
            {QStringLiteral("maxMemoryUsage"), static_cast<qint64>(resourceLimiter.maxMemoryUsage)},
            {QStringLiteral("memoryCheckInterval"), static_cast<qint64>(resourceLimiter.memoryCheckInterval.count())},
            {QStringLiteral("monitorMemory"), resourceLimiter.monitorMemory},
            {QStringLiteral("maxASTDepth"), resourceLimiter.maxASTDepth},
            {QStringLiteral("maxASTNodes"), static_cast<qint64>(resourceLimiter.maxASTNodes)},
            {QStringLiteral("maxDirectoryDepth"), resourceLimiter.maxDirectoryDepth},
            {QStringLiteral("maxDirectoriesScanned"), static_cast<qint64>(resourceLimiter.maxDirectoriesScanned)},
        }},
        {QStringLiteral("sandboxedParser"), QJsonObject{
            {QStringLiteral("parseTimeout"), static_cast<qint64>(sandboxedParser.parseTimeout.count())},
            {QStringLiteral("maxLineLength"), static_cast<qint64>(sandboxedParser.maxLineLength)},
            {QStringLiteral("useWorkerThreads"), sandboxedParser.useWorkerThreads},
            {QStringLiteral("maxWorkers"), sandboxedParser.maxWorkers},
        }},
    };
}

} // namespace Kalkan::Core
