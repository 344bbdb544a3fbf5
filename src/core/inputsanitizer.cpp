#include "inputsanitizer.hpp"
#include "logging.hpp"

#include <QMetaType>
#include <QStringList>
#include <QVariantList>

#include <cmath>
#include <vector>

namespace Kalkan::Core {

namespace {

const QString kDefaultComponentNamePattern = QStringLiteral(R"(^[A-Z][a-zA-Z0-9_$]*(\.[A-Z][a-zA-Z0-9_$]*)*$)");
const QString kDefaultPropNamePattern = QStringLiteral(R"(^[a-zA-Z_$][a-zA-Z0-9_$-]*$)");
const QString kDefaultSearchValuePattern = QStringLiteral(R"(^[^<>'";&|`$(){}[\]\\]*$)");

const std::vector<QRegularExpression>& dangerousPatterns()
{
    static const std::vector<QRegularExpression> patterns = {
        QRegularExpression(QStringLiteral(R"(\$\{.*\})")),
        QRegularExpression(QStringLiteral(R"(eval\s*\()")),
        QRegularExpression(QStringLiteral(R"(Function\s*\()")),
        QRegularExpression(QStringLiteral(R"(setTimeout\s*\()")),
        QRegularExpression(QStringLiteral(R"(setInterval\s*\()")),
        QRegularExpression(QStringLiteral("__proto__")),
        QRegularExpression(QStringLiteral("constructor")),
        QRegularExpression(QStringLiteral(R"(\.\.)")),
        QRegularExpression(QStringLiteral("<script"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("javascript:"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("data:"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("vbscript:"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral(R"(on\w+\s*=)"), QRegularExpression::CaseInsensitiveOption),
    };
    return patterns;
}

// Shapes prone to catastrophic backtracking
const std::vector<QRegularExpression>& backtrackingShapes()
{
    static const std::vector<QRegularExpression> shapes = {
        QRegularExpression(QStringLiteral(R"(\(\?=)")),
        QRegularExpression(QStringLiteral(R"(\(\?!)")),
        QRegularExpression(QStringLiteral(R"(\(\?<=)")),
        QRegularExpression(QStringLiteral(R"(\(\?<!)")),
        QRegularExpression(QStringLiteral(R"(\*\+)")),
        QRegularExpression(QStringLiteral(R"(\+\*)")),
        QRegularExpression(QStringLiteral(R"(\{\d+,\})")),
        QRegularExpression(QStringLiteral(R"(\([^)]*[+*][^)]*\)[+*])")),
        QRegularExpression(QStringLiteral(R"(\([^)]*[+*][^)]*\)\{)")),
        QRegularExpression(QStringLiteral(R"([+*]\{[^}]*,\})")),
        QRegularExpression(QStringLiteral(R"(\.\*\.\*)")),
        QRegularExpression(QStringLiteral(R"(\.\+\.\+)")),
    };
    return shapes;
}

const QRegularExpression kDriveLetter(QStringLiteral("^[A-Za-z]:"));

SecurityError fieldError(ErrorKind kind, const char* code, const QString& message, const QString& field)
{
    qCWarning(lcSanitizer).noquote() << "Rejected" << field << "-" << code;
    return SecurityError(kind, code, message.toStdString(), field.toStdString());
}

bool isStringType(const QVariant& input)
{
    return input.typeId() == QMetaType::QString;
}

bool isMissing(const QVariant& value)
{
    if (!value.isValid() || value.isNull()) {
        return true;
    }
    if (isStringType(value)) {
        return value.toString().isEmpty();
    }
    if (value.typeId() == QMetaType::Bool) {
        return !value.toBool();
    }
    return false;
}

} // namespace

QVariantMap AnalyzeParams::toVariantMap() const
{
    QVariantMap map;
    map.insert(QStringLiteral("rootDir"), rootDir);
    map.insert(QStringLiteral("componentName"), componentName);
    map.insert(QStringLiteral("propName"), propName);
    if (propValue) {
        map.insert(QStringLiteral("propValue"), *propValue);
    }
    if (findMissing) {
        map.insert(QStringLiteral("findMissing"), *findMissing);
    }
    if (verbose) {
        map.insert(QStringLiteral("verbose"), *verbose);
    }
    if (includes) {
        map.insert(QStringLiteral("includes"), *includes);
    }
    return map;
}

InputSanitizer::InputSanitizer(SanitizerOptions options)
    : options_(std::move(options))
{
    componentRule_.field = QStringLiteral("componentName");
    componentRule_.allowPattern = QRegularExpression(
        options_.componentNamePattern.isEmpty() ? kDefaultComponentNamePattern : options_.componentNamePattern);
    componentRule_.formatCode = QStringLiteral("INVALID_FORMAT");
    componentRule_.formatMessage = QStringLiteral(
        "Component name must start with an uppercase letter and contain only alphanumeric characters, underscores and dots");

    propRule_.field = QStringLiteral("propName");
    propRule_.allowPattern = QRegularExpression(
        options_.propNamePattern.isEmpty() ? kDefaultPropNamePattern : options_.propNamePattern);
    propRule_.formatCode = QStringLiteral("INVALID_FORMAT");
    propRule_.formatMessage = QStringLiteral(
        "Prop name must be an identifier made of alphanumeric characters, underscores and hyphens");

    // The allow-pattern of a search value is itself the injection filter
    searchRule_.field = QStringLiteral("searchValue");
    searchRule_.allowPattern = QRegularExpression(
        options_.searchValuePattern.isEmpty() ? kDefaultSearchValuePattern : options_.searchValuePattern);
    searchRule_.formatKind = ErrorKind::DangerousContent;
    searchRule_.formatCode = QStringLiteral("DANGEROUS_CHARACTERS");
    searchRule_.formatMessage = QStringLiteral("Search value contains potentially dangerous characters");
    searchRule_.trim = false;
}

Result<QString> InputSanitizer::applyRule(const QVariant& input, const FieldRule& rule) const
{
    if (!isStringType(input)) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_TYPE", rule.field + QStringLiteral(" must be a string"), rule.field);
    }

    const QString value = input.toString();
    if (value.isEmpty() && !rule.allowEmpty) {
        return fieldError(ErrorKind::InvalidInput, "EMPTY_VALUE", rule.field + QStringLiteral(" cannot be empty"), rule.field);
    }

    if (value.size() > options_.maxStringLength) {
        SecurityError error = fieldError(ErrorKind::InvalidInput, "TOO_LONG",
                                         QStringLiteral("%1 exceeds maximum length of %2").arg(rule.field).arg(options_.maxStringLength),
                                         rule.field);
        return error.withLimit(options_.maxStringLength, value.size());
    }

    if (!rule.allowPattern.match(value).hasMatch()) {
        // A value that fails the format because it carries an injection
        // marker is reported as the more specific violation
        if (rule.denyScan && containsDangerousPatterns(value)) {
            return fieldError(ErrorKind::DangerousContent, "DANGEROUS_PATTERN",
                              rule.field + QStringLiteral(" contains potentially dangerous patterns"), rule.field);
        }
        return fieldError(rule.formatKind, rule.formatCode.toLatin1().constData(), rule.formatMessage, rule.field);
    }

    if (rule.denyScan && containsDangerousPatterns(value)) {
        return fieldError(ErrorKind::DangerousContent, "DANGEROUS_PATTERN",
                          rule.field + QStringLiteral(" contains potentially dangerous patterns"), rule.field);
    }

    return rule.trim ? value.trimmed() : value;
}

Result<QString> InputSanitizer::sanitizeComponentName(const QVariant& input) const
{
    return applyRule(input, componentRule_);
}

Result<QString> InputSanitizer::sanitizePropName(const QVariant& input) const
{
    return applyRule(input, propRule_);
}

Result<QString> InputSanitizer::sanitizeSearchValue(const QVariant& input) const
{
    return applyRule(input, searchRule_);
}

Result<QString> InputSanitizer::sanitizeRegexPattern(const QVariant& input) const
{
    const QString field = QStringLiteral("regexPattern");
    if (!isStringType(input)) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_TYPE", QStringLiteral("Regex pattern must be a string"), field);
    }

    const QString pattern = input.toString();
    if (pattern.isEmpty()) {
        return fieldError(ErrorKind::InvalidInput, "EMPTY_VALUE", QStringLiteral("Regex pattern cannot be empty"), field);
    }

    if (pattern.size() > options_.maxStringLength) {
        SecurityError error = fieldError(ErrorKind::InvalidInput, "TOO_LONG",
                                         QStringLiteral("Regex pattern exceeds maximum length of %1").arg(options_.maxStringLength),
                                         field);
        return error.withLimit(options_.maxStringLength, pattern.size());
    }

    const QRegularExpression compiled(pattern);
    if (!compiled.isValid()) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_REGEX",
                          QStringLiteral("Invalid regex pattern: %1").arg(compiled.errorString()), field);
    }

    for (const auto& shape : backtrackingShapes()) {
        if (shape.match(pattern).hasMatch()) {
            return fieldError(ErrorKind::DangerousContent, "DANGEROUS_REGEX",
                              QStringLiteral("Regex pattern contains constructs that could cause catastrophic backtracking"),
                              field);
        }
    }

    return pattern;
}

Result<QString> InputSanitizer::sanitizeGlobPattern(const QVariant& input) const
{
    const QString field = QStringLiteral("globPattern");
    if (!isStringType(input)) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_TYPE", QStringLiteral("Glob pattern must be a string"), field);
    }

    const QString pattern = input.toString();
    if (pattern.isEmpty()) {
        return fieldError(ErrorKind::InvalidInput, "EMPTY_VALUE", QStringLiteral("Glob pattern cannot be empty"), field);
    }

    if (pattern.size() > options_.maxStringLength) {
        SecurityError error = fieldError(ErrorKind::InvalidInput, "TOO_LONG",
                                         QStringLiteral("Glob pattern exceeds maximum length of %1").arg(options_.maxStringLength),
                                         field);
        return error.withLimit(options_.maxStringLength, pattern.size());
    }

    if (pattern.contains(QStringLiteral("../")) || pattern.contains(QStringLiteral("..\\"))) {
        return fieldError(ErrorKind::PathTraversal, "PATH_TRAVERSAL",
                          QStringLiteral("Glob pattern contains path traversal sequences"), field);
    }

    if (pattern.startsWith(QLatin1Char('/')) || kDriveLetter.match(pattern).hasMatch()) {
        return fieldError(ErrorKind::InvalidInput, "ABSOLUTE_PATH", QStringLiteral("Glob pattern cannot be an absolute path"), field);
    }

    if (containsDangerousPatterns(pattern)) {
        return fieldError(ErrorKind::DangerousContent, "DANGEROUS_PATTERN",
                          QStringLiteral("Glob pattern contains potentially dangerous patterns"), field);
    }

    return pattern.trimmed();
}

Result<QString> InputSanitizer::sanitizeString(const QVariant& input, const QString& fieldName, const StringOptions& options) const
{
    if (!isStringType(input)) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_TYPE", fieldName + QStringLiteral(" must be a string"), fieldName);
    }

    const QString value = input.toString();
    const int maxLength = options.maxLength > 0 ? options.maxLength : options_.maxStringLength;
    if (value.size() > maxLength) {
        SecurityError error = fieldError(ErrorKind::InvalidInput, "TOO_LONG",
                                         QStringLiteral("%1 exceeds maximum length of %2").arg(fieldName).arg(maxLength),
                                         fieldName);
        return error.withLimit(maxLength, value.size());
    }

    if (value.contains(QChar(u'\0'))) {
        return fieldError(ErrorKind::InvalidInput, "NULL_BYTE", fieldName + QStringLiteral(" contains null bytes"), fieldName);
    }

    if (!options.allowDangerousPatterns && containsDangerousPatterns(value)) {
        return fieldError(ErrorKind::DangerousContent, "DANGEROUS_PATTERN",
                          fieldName + QStringLiteral(" contains potentially dangerous patterns"), fieldName);
    }

    return options.trim ? value.trimmed() : value;
}

Result<QVariant> InputSanitizer::sanitizeCompositeValue(const QVariant& input, const CompositeOptions& options) const
{
    return sanitizeComposite(input, options, 0);
}

Result<QVariant> InputSanitizer::sanitizeComposite(const QVariant& input, const CompositeOptions& options, int depth) const
{
    const QString field = QStringLiteral("propValue");

    if (!input.isValid() || input.isNull()) {
        return input;
    }

    if (depth > options_.maxNestingDepth) {
        SecurityError error = fieldError(ErrorKind::ResourceExceeded, "NESTING_TOO_DEEP",
                                         QStringLiteral("Prop value nesting exceeds %1 levels").arg(options_.maxNestingDepth),
                                         field);
        return error.withLimit(options_.maxNestingDepth, depth);
    }

    switch (input.typeId()) {
    case QMetaType::Bool:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
        return input;

    case QMetaType::Double:
    case QMetaType::Float:
        if (!std::isfinite(input.toDouble())) {
            return fieldError(ErrorKind::InvalidInput, "INVALID_NUMBER", QStringLiteral("Prop value must be a finite number"), field);
        }
        return input;

    case QMetaType::QString: {
        auto sanitized = sanitizeString(input, field);
        if (!sanitized) {
            return sanitized.error();
        }
        return QVariant(sanitized.value());
    }

    case QMetaType::QStringList:
    case QMetaType::QVariantList: {
        const QVariantList items = input.toList();
        if (items.size() > options_.maxArrayLength) {
            SecurityError error = fieldError(ErrorKind::ResourceExceeded, "ARRAY_TOO_LONG",
                                             QStringLiteral("Prop value array exceeds maximum length of %1").arg(options_.maxArrayLength),
                                             field);
            return error.withLimit(options_.maxArrayLength, items.size());
        }

        QVariantList sanitized;
        sanitized.reserve(items.size());
        for (const QVariant& item : items) {
            auto child = sanitizeComposite(item, options, depth + 1);
            if (!child) {
                return child;
            }
            sanitized.append(child.value());
        }
        return QVariant(sanitized);
    }

    case QMetaType::QVariantMap: {
        if (!options.allowObjects) {
            return fieldError(ErrorKind::InvalidInput, "OBJECTS_NOT_ALLOWED",
                              QStringLiteral("Object prop values are not allowed in this context"), field);
        }

        const QVariantMap object = input.toMap();
        if (object.size() > options_.maxArrayLength) {
            SecurityError error = fieldError(ErrorKind::ResourceExceeded, "OBJECT_TOO_LARGE",
                                             QStringLiteral("Prop value object has too many keys (max: %1)").arg(options_.maxArrayLength),
                                             field);
            return error.withLimit(options_.maxArrayLength, object.size());
        }

        QVariantMap sanitized;
        for (auto it = object.cbegin(); it != object.cend(); ++it) {
            auto key = sanitizeString(QVariant(it.key()), QStringLiteral("propValue.key"));
            if (!key) {
                return key.error();
            }
            auto child = sanitizeComposite(it.value(), options, depth + 1);
            if (!child) {
                return child;
            }
            sanitized.insert(key.value(), child.value());
        }
        return QVariant(sanitized);
    }

    default:
        return fieldError(ErrorKind::InvalidInput, "UNSUPPORTED_TYPE",
                          QStringLiteral("Unsupported prop value type: %1").arg(QString::fromLatin1(input.typeName())),
                          field);
    }
}

Result<bool> InputSanitizer::requireBoolean(const QVariant& input, const QString& field) const
{
    if (input.typeId() != QMetaType::Bool) {
        return fieldError(ErrorKind::InvalidInput, "INVALID_TYPE", field + QStringLiteral(" must be a boolean"), field);
    }
    return input.toBool();
}

Result<AnalyzeParams> InputSanitizer::sanitizeAnalyzeParams(const QVariantMap& params) const
{
    for (const char* required : {"rootDir", "componentName", "propName"}) {
        const QString key = QString::fromLatin1(required);
        if (isMissing(params.value(key))) {
            return fieldError(ErrorKind::InvalidInput, "MISSING_REQUIRED", key + QStringLiteral(" parameter is required"), key);
        }
    }

    AnalyzeParams sanitized;

    // Containment of the root is decided by the path validator, so parent
    // segments are not rejected here
    StringOptions rootOptions;
    rootOptions.allowDangerousPatterns = true;
    auto rootDir = sanitizeString(params.value(QStringLiteral("rootDir")), QStringLiteral("rootDir"), rootOptions);
    if (!rootDir) {
        return rootDir.error();
    }
    sanitized.rootDir = rootDir.value();

    auto componentName = sanitizeComponentName(params.value(QStringLiteral("componentName")));
    if (!componentName) {
        return componentName.error();
    }
    sanitized.componentName = componentName.value();

    auto propName = sanitizePropName(params.value(QStringLiteral("propName")));
    if (!propName) {
        return propName.error();
    }
    sanitized.propName = propName.value();

    const QVariant propValue = params.value(QStringLiteral("propValue"));
    if (propValue.isValid() && !propValue.isNull()) {
        auto value = sanitizeCompositeValue(propValue);
        if (!value) {
            return value.error();
        }
        sanitized.propValue = value.value();
    }

    const std::pair<const char*, std::optional<bool>*> flags[] = {
        {"findMissing", &sanitized.findMissing},
        {"verbose", &sanitized.verbose},
        {"includes", &sanitized.includes},
    };
    for (const auto& [name, target] : flags) {
        const QString key = QString::fromLatin1(name);
        if (!params.contains(key)) {
            continue;
        }
        auto flag = requireBoolean(params.value(key), key);
        if (!flag) {
            return flag.error();
        }
        *target = flag.value();
    }

    return sanitized;
}

bool InputSanitizer::containsDangerousPatterns(const QString& input)
{
    for (const auto& pattern : dangerousPatterns()) {
        if (pattern.match(input).hasMatch()) {
            return true;
        }
    }
    return false;
}

} // namespace Kalkan::Core
