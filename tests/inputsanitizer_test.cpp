#include <gtest/gtest.h>

#include <QVariantList>
#include <QVariantMap>

#include <limits>

#include "core/inputsanitizer.hpp"

using namespace Kalkan::Core;

class InputSanitizerTest : public ::testing::Test {
protected:
    InputSanitizer sanitizer;

    static QVariantMap baseParams()
    {
        return QVariantMap{
            {QStringLiteral("rootDir"), QStringLiteral("./src")},
            {QStringLiteral("componentName"), QStringLiteral("Button")},
            {QStringLiteral("propName"), QStringLiteral("onClick")},
        };
    }
};

TEST_F(InputSanitizerTest, ComponentNameAcceptsPascalCaseAndNamespaces)
{
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("MyComponent")).value(), QStringLiteral("MyComponent"));
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("Form.Input")).value(), QStringLiteral("Form.Input"));
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("Icon$2")).value(), QStringLiteral("Icon$2"));
}

TEST_F(InputSanitizerTest, ScriptTagAsComponentNameIsDangerous)
{
    const auto result = sanitizer.sanitizeComponentName(QStringLiteral("<script>alert(1)</script>"));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.kind(), ErrorKind::DangerousContent);
    EXPECT_EQ(result.error().context, "componentName");
}

TEST_F(InputSanitizerTest, ComponentNameFormatViolations)
{
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("button")).code(), "INVALID_FORMAT");
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("My Component")).code(), "INVALID_FORMAT");
    EXPECT_EQ(sanitizer.sanitizeComponentName(QStringLiteral("Form.input")).code(), "INVALID_FORMAT");
    EXPECT_EQ(sanitizer.sanitizeComponentName(QString()).code(), "EMPTY_VALUE");
    EXPECT_EQ(sanitizer.sanitizeComponentName(QVariant(42)).code(), "INVALID_TYPE");
    EXPECT_EQ(sanitizer.sanitizeComponentName(QVariant()).kind(), ErrorKind::InvalidInput);
}

TEST_F(InputSanitizerTest, DenyScanAppliesEvenWhenFormatMatches)
{
    const auto proto = sanitizer.sanitizePropName(QStringLiteral("__proto__"));
    EXPECT_EQ(proto.kind(), ErrorKind::DangerousContent);
    EXPECT_EQ(proto.code(), "DANGEROUS_PATTERN");

    const auto ctor = sanitizer.sanitizePropName(QStringLiteral("constructor"));
    EXPECT_EQ(ctor.kind(), ErrorKind::DangerousContent);
}

TEST_F(InputSanitizerTest, ComponentNameLengthCeiling)
{
    SanitizerOptions options;
    options.maxStringLength = 8;
    const InputSanitizer strict(options);

    const auto result = strict.sanitizeComponentName(QStringLiteral("VeryLongName"));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), "TOO_LONG");
    EXPECT_EQ(result.error().limit, 8);
    EXPECT_EQ(result.error().observed, 12);
}

TEST_F(InputSanitizerTest, PropNames)
{
    EXPECT_EQ(sanitizer.sanitizePropName(QStringLiteral("onClick")).value(), QStringLiteral("onClick"));
    EXPECT_EQ(sanitizer.sanitizePropName(QStringLiteral("data-test-id")).value(), QStringLiteral("data-test-id"));
    EXPECT_EQ(sanitizer.sanitizePropName(QStringLiteral("_private")).value(), QStringLiteral("_private"));
    EXPECT_EQ(sanitizer.sanitizePropName(QStringLiteral("1st")).code(), "INVALID_FORMAT");
    EXPECT_EQ(sanitizer.sanitizePropName(QStringLiteral("on click")).code(), "INVALID_FORMAT");
}

TEST_F(InputSanitizerTest, CustomPatternOverridesDefault)
{
    SanitizerOptions options;
    options.componentNamePattern = QStringLiteral("^[a-z]+$");
    const InputSanitizer custom(options);

    EXPECT_TRUE(custom.sanitizeComponentName(QStringLiteral("button")).isSuccess());
    EXPECT_EQ(custom.sanitizeComponentName(QStringLiteral("Button")).code(), "INVALID_FORMAT");
}

TEST_F(InputSanitizerTest, SearchValueRejectsShellAndMarkupCharacters)
{
    EXPECT_EQ(sanitizer.sanitizeSearchValue(QStringLiteral("primary button")).value(), QStringLiteral("primary button"));

    for (const QString& bad : {QStringLiteral("a<b"), QStringLiteral("x;rm"), QStringLiteral("$(id)"),
                               QStringLiteral("`cmd`"), QStringLiteral("a|b"), QStringLiteral("\"quoted\"")}) {
        const auto result = sanitizer.sanitizeSearchValue(bad);
        EXPECT_EQ(result.kind(), ErrorKind::DangerousContent) << bad.toStdString();
        EXPECT_EQ(result.code(), "DANGEROUS_CHARACTERS") << bad.toStdString();
    }
}

TEST_F(InputSanitizerTest, SearchValueIsNotTrimmed)
{
    EXPECT_EQ(sanitizer.sanitizeSearchValue(QStringLiteral("  padded  ")).value(), QStringLiteral("  padded  "));
}

TEST_F(InputSanitizerTest, NestedQuantifierRegexIsDangerous)
{
    const auto result = sanitizer.sanitizeRegexPattern(QStringLiteral("(a+)+b"));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.kind(), ErrorKind::DangerousContent);
    EXPECT_EQ(result.code(), "DANGEROUS_REGEX");
}

TEST_F(InputSanitizerTest, SafeRegexIsUnchangedAndIdempotent)
{
    const QString pattern = QStringLiteral("^[a-zA-Z]+$");
    const auto first = sanitizer.sanitizeRegexPattern(pattern);
    ASSERT_TRUE(first.isSuccess());
    EXPECT_EQ(first.value(), pattern);

    const auto second = sanitizer.sanitizeRegexPattern(first.value());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_EQ(second.value(), first.value());
}

TEST_F(InputSanitizerTest, BacktrackingShapes)
{
    for (const QString& shape : {QStringLiteral("(?=a)b"), QStringLiteral("(?!a)b"), QStringLiteral("(?<=a)b"),
                                 QStringLiteral("(?<!a)b"), QStringLiteral("a{2,}"), QStringLiteral("(a*)*"),
                                 QStringLiteral("(ab+){3}"), QStringLiteral(".*.*x"), QStringLiteral(".+.+x")}) {
        EXPECT_EQ(sanitizer.sanitizeRegexPattern(shape).code(), "DANGEROUS_REGEX") << shape.toStdString();
    }
}

TEST_F(InputSanitizerTest, InvalidRegexDoesNotCompile)
{
    const auto result = sanitizer.sanitizeRegexPattern(QStringLiteral("([a-z"));
    EXPECT_EQ(result.kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(result.code(), "INVALID_REGEX");
}

TEST_F(InputSanitizerTest, GlobPatterns)
{
    EXPECT_EQ(sanitizer.sanitizeGlobPattern(QStringLiteral("src/**/*.jsx")).value(), QStringLiteral("src/**/*.jsx"));

    EXPECT_EQ(sanitizer.sanitizeGlobPattern(QStringLiteral("../secrets/*")).kind(), ErrorKind::PathTraversal);
    EXPECT_EQ(sanitizer.sanitizeGlobPattern(QStringLiteral("a\\..\\..\\b")).kind(), ErrorKind::PathTraversal);
    EXPECT_EQ(sanitizer.sanitizeGlobPattern(QStringLiteral("/etc/*")).code(), "ABSOLUTE_PATH");
    EXPECT_EQ(sanitizer.sanitizeGlobPattern(QStringLiteral("C:\\Windows\\*")).code(), "ABSOLUTE_PATH");
}

TEST_F(InputSanitizerTest, GenericStringDenyList)
{
    for (const QString& bad : {QStringLiteral("${process.env}"), QStringLiteral("eval (x)"),
                               QStringLiteral("new Function('x')"), QStringLiteral("setTimeout(f)"),
                               QStringLiteral("setInterval(f)"), QStringLiteral("a.__proto__"),
                               QStringLiteral("../x"), QStringLiteral("<SCRIPT src=x>"),
                               QStringLiteral("JavaScript:alert(1)"), QStringLiteral("data:text/html"),
                               QStringLiteral("vbscript:msg"), QStringLiteral("img onerror = x")}) {
        const auto result = sanitizer.sanitizeString(bad);
        EXPECT_EQ(result.kind(), ErrorKind::DangerousContent) << bad.toStdString();
    }
}

TEST_F(InputSanitizerTest, GenericStringTrimsAndHonoursOptions)
{
    EXPECT_EQ(sanitizer.sanitizeString(QStringLiteral("  hello  ")).value(), QStringLiteral("hello"));
    EXPECT_EQ(sanitizer.sanitizeString(QString()).value(), QString());

    StringOptions keep;
    keep.trim = false;
    keep.allowDangerousPatterns = true;
    EXPECT_EQ(sanitizer.sanitizeString(QStringLiteral(" ../x "), QStringLiteral("path"), keep).value(),
              QStringLiteral(" ../x "));

    StringOptions shortOnly;
    shortOnly.maxLength = 3;
    const auto tooLong = sanitizer.sanitizeString(QStringLiteral("abcd"), QStringLiteral("tag"), shortOnly);
    EXPECT_EQ(tooLong.code(), "TOO_LONG");
    EXPECT_EQ(tooLong.error().context, "tag");

    EXPECT_EQ(sanitizer.sanitizeString(QString(QStringLiteral("a")) + QChar(u'\0') + QStringLiteral("b")).code(),
              "NULL_BYTE");
}

TEST_F(InputSanitizerTest, CompositeScalars)
{
    EXPECT_TRUE(sanitizer.sanitizeCompositeValue(QVariant()).isSuccess());
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(true).value(), QVariant(true));
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(42).value(), QVariant(42));
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(2.5).value(), QVariant(2.5));
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(QStringLiteral(" primary ")).value(), QVariant(QStringLiteral("primary")));

    EXPECT_EQ(sanitizer.sanitizeCompositeValue(std::numeric_limits<double>::infinity()).code(), "INVALID_NUMBER");
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(std::numeric_limits<double>::quiet_NaN()).code(), "INVALID_NUMBER");
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(QStringLiteral("javascript:x")).kind(), ErrorKind::DangerousContent);
}

TEST_F(InputSanitizerTest, CompositeListsAndMaps)
{
    const QVariantList list{1, QStringLiteral("two"), QVariantMap{{QStringLiteral("k"), false}}};
    const auto sanitized = sanitizer.sanitizeCompositeValue(list);
    ASSERT_TRUE(sanitized.isSuccess()) << sanitized.error().describe();
    EXPECT_EQ(sanitized.value().toList().size(), 3);

    const QVariantMap badKey{{QStringLiteral("__proto__"), 1}};
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(badKey).kind(), ErrorKind::DangerousContent);

    const QVariantMap badValue{{QStringLiteral("ok"), QVariantList{QStringLiteral("eval(1)")}}};
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(badValue).kind(), ErrorKind::DangerousContent);

    CompositeOptions noObjects;
    noObjects.allowObjects = false;
    EXPECT_EQ(sanitizer.sanitizeCompositeValue(QVariantMap{{QStringLiteral("a"), 1}}, noObjects).code(),
              "OBJECTS_NOT_ALLOWED");
}

TEST_F(InputSanitizerTest, CompositeSizeAndNestingCeilings)
{
    SanitizerOptions options;
    options.maxArrayLength = 3;
    options.maxNestingDepth = 2;
    const InputSanitizer strict(options);

    const auto longList = strict.sanitizeCompositeValue(QVariantList{1, 2, 3, 4});
    EXPECT_EQ(longList.kind(), ErrorKind::ResourceExceeded);
    EXPECT_EQ(longList.code(), "ARRAY_TOO_LONG");
    EXPECT_EQ(longList.error().limit, 3);
    EXPECT_EQ(longList.error().observed, 4);

    const QVariantMap wide{{QStringLiteral("a"), 1}, {QStringLiteral("b"), 2},
                           {QStringLiteral("c"), 3}, {QStringLiteral("d"), 4}};
    EXPECT_EQ(strict.sanitizeCompositeValue(wide).code(), "OBJECT_TOO_LARGE");

    QVariant deep(QVariantList{1});
    for (int i = 0; i < 3; ++i) {
        deep = QVariant(QVariantList{deep});
    }
    EXPECT_EQ(strict.sanitizeCompositeValue(deep).code(), "NESTING_TOO_DEEP");
}

TEST_F(InputSanitizerTest, CompositeRejectsUnsupportedTypes)
{
    const auto result = sanitizer.sanitizeCompositeValue(QVariant(QByteArray("raw")));
    EXPECT_EQ(result.kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(result.code(), "UNSUPPORTED_TYPE");
}

TEST_F(InputSanitizerTest, AnalyzeParamsHappyPath)
{
    QVariantMap params = baseParams();
    params.insert(QStringLiteral("propValue"), QStringLiteral("submit"));
    params.insert(QStringLiteral("findMissing"), true);
    params.insert(QStringLiteral("verbose"), false);

    const auto result = sanitizer.sanitizeAnalyzeParams(params);
    ASSERT_TRUE(result.isSuccess()) << result.error().describe();
    EXPECT_EQ(result->rootDir, QStringLiteral("./src"));
    EXPECT_EQ(result->componentName, QStringLiteral("Button"));
    EXPECT_EQ(result->propName, QStringLiteral("onClick"));
    ASSERT_TRUE(result->propValue.has_value());
    EXPECT_EQ(result->propValue->toString(), QStringLiteral("submit"));
    EXPECT_EQ(result->findMissing, true);
    EXPECT_EQ(result->verbose, false);
    EXPECT_FALSE(result->includes.has_value());

    const QVariantMap round = result->toVariantMap();
    EXPECT_EQ(round.value(QStringLiteral("findMissing")).toBool(), true);
    EXPECT_FALSE(round.contains(QStringLiteral("includes")));
}

TEST_F(InputSanitizerTest, AnalyzeParamsMissingRequiredFields)
{
    for (const QString& key : {QStringLiteral("rootDir"), QStringLiteral("componentName"), QStringLiteral("propName")}) {
        QVariantMap params = baseParams();
        params.remove(key);

        const auto result = sanitizer.sanitizeAnalyzeParams(params);
        EXPECT_EQ(result.kind(), ErrorKind::InvalidInput) << key.toStdString();
        EXPECT_EQ(result.code(), "MISSING_REQUIRED") << key.toStdString();
        EXPECT_EQ(result.error().context, key.toStdString());
    }
}

TEST_F(InputSanitizerTest, AnalyzeParamsFlagsMustBeBoolean)
{
    QVariantMap params = baseParams();
    params.insert(QStringLiteral("includes"), QStringLiteral("yes"));

    const auto result = sanitizer.sanitizeAnalyzeParams(params);
    EXPECT_EQ(result.kind(), ErrorKind::InvalidInput);
    EXPECT_EQ(result.error().context, "includes");
}

TEST_F(InputSanitizerTest, AnalyzeParamsLeavesParentSegmentsToPathValidation)
{
    QVariantMap params = baseParams();
    params.insert(QStringLiteral("rootDir"), QStringLiteral("../../etc"));

    const auto result = sanitizer.sanitizeAnalyzeParams(params);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->rootDir, QStringLiteral("../../etc"));
}

TEST_F(InputSanitizerTest, AnalyzeParamsRejectsDangerousComponent)
{
    QVariantMap params = baseParams();
    params.insert(QStringLiteral("componentName"), QStringLiteral("<script>alert(1)</script>"));

    EXPECT_EQ(sanitizer.sanitizeAnalyzeParams(params).kind(), ErrorKind::DangerousContent);
}
