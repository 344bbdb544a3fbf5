#ifndef INPUTSANITIZER_HPP
#define INPUTSANITIZER_HPP

#include <QRegularExpression>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include <optional>
#include "errors/securityerror.hpp"

namespace Kalkan::Core {

/**
 * @brief Configuration of an InputSanitizer
 *
 * Empty pattern strings select the built-in defaults.
 */
struct SanitizerOptions {
    int maxStringLength = 1000;
    int maxArrayLength = 100;
    int maxNestingDepth = 32;
    QString componentNamePattern;
    QString propNamePattern;
    QString searchValuePattern;
};

struct StringOptions {
    int maxLength = 0;  // 0 means SanitizerOptions::maxStringLength
    bool allowDangerousPatterns = false;
    bool trim = true;
};

struct CompositeOptions {
    bool allowObjects = true;
};

/**
 * @brief Parameter bag accepted by the analyze entry point, after sanitization
 */
struct AnalyzeParams {
    QString rootDir;
    QString componentName;
    QString propName;
    std::optional<QVariant> propValue;
    std::optional<bool> findMissing;
    std::optional<bool> verbose;
    std::optional<bool> includes;

    QVariantMap toVariantMap() const;
};

/**
 * @brief Validates and cleans user-supplied parameters
 *
 * Every field validator runs the same pipeline: type check, non-empty
 * check, length check, allow-pattern, deny-pattern scan, trim. Rules are
 * fixed at construction.
 */
class InputSanitizer {
public:
    explicit InputSanitizer(SanitizerOptions options = SanitizerOptions());

    Result<QString> sanitizeComponentName(const QVariant& input) const;
    Result<QString> sanitizePropName(const QVariant& input) const;
    Result<QString> sanitizeSearchValue(const QVariant& input) const;

    /**
     * @brief Checks that a regular expression compiles and is not an obvious ReDoS shape
     *
     * The shape list is heuristic. It catches nested quantifiers and
     * lookaround, not every exponential pattern.
     * @return The pattern unchanged
     */
    Result<QString> sanitizeRegexPattern(const QVariant& input) const;

    /**
     * @brief Rejects glob patterns that climb out of the scan root or are absolute
     */
    Result<QString> sanitizeGlobPattern(const QVariant& input) const;

    Result<QString> sanitizeString(const QVariant& input,
                                   const QString& fieldName = QStringLiteral("string"),
                                   const StringOptions& options = StringOptions()) const;

    /**
     * @brief Recursively sanitizes a nested value (null, bool, number, string, list, map)
     */
    Result<QVariant> sanitizeCompositeValue(const QVariant& input,
                                            const CompositeOptions& options = CompositeOptions()) const;

    Result<AnalyzeParams> sanitizeAnalyzeParams(const QVariantMap& params) const;

    /**
     * @brief Scans for template injection, dynamic code, prototype access,
     * parent-path segments, script tags and privileged URL schemes
     */
    static bool containsDangerousPatterns(const QString& input);

    const SanitizerOptions& options() const { return options_; }

private:
    struct FieldRule {
        QString field;
        QRegularExpression allowPattern;
        ErrorKind formatKind = ErrorKind::InvalidInput;
        QString formatCode;
        QString formatMessage;
        bool allowEmpty = false;
        bool denyScan = true;
        bool trim = true;
    };

    SanitizerOptions options_;
    FieldRule componentRule_;
    FieldRule propRule_;
    FieldRule searchRule_;

    Result<QString> applyRule(const QVariant& input, const FieldRule& rule) const;
    Result<QVariant> sanitizeComposite(const QVariant& input, const CompositeOptions& options, int depth) const;
    Result<bool> requireBoolean(const QVariant& input, const QString& field) const;
};

} // namespace Kalkan::Core

#endif // INPUTSANITIZER_HPP
