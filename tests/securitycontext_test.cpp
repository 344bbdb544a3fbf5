#include <gtest/gtest.h>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>

#include <filesystem>

#include "core/securitycontext.hpp"
#include "testutils.hpp"

using namespace Kalkan::Core;
using Kalkan::Test::TempDir;

namespace fs = std::filesystem;

namespace {

// Switches the working directory for the lifetime of the object
class WorkingDirectory {
public:
    explicit WorkingDirectory(const fs::path& path)
        : previous_(fs::current_path())
    {
        fs::current_path(path);
    }

    ~WorkingDirectory()
    {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

private:
    fs::path previous_;
};

SecurityConfig quietConfig()
{
    SecurityConfig config;
    config.resourceLimiter.monitorMemory = false;
    return config;
}

QVariantMap analyzeParams(const QString& rootDir)
{
    return QVariantMap{
        {QStringLiteral("rootDir"), rootDir},
        {QStringLiteral("componentName"), QStringLiteral("Button")},
        {QStringLiteral("propName"), QStringLiteral("onClick")},
    };
}

class FixedGrammar : public SourceGrammar {
public:
    std::unique_ptr<SyntaxNode> parse(const std::string&, GrammarMode, const CancellationToken&) const override
    {
        auto root = std::make_unique<SyntaxNode>("Program", 1, 1);
        root->addChild(std::make_unique<SyntaxNode>("Fixed", 1, 1));
        return root;
    }

    std::string name() const override { return "fixed"; }
};

class SecurityContextTest : public ::testing::Test {
protected:
    TempDir temp;
};

} // namespace

TEST_F(SecurityContextTest, ResolvesRootDirectoryInsideAllowedRoot)
{
    temp.makeDir("test");
    WorkingDirectory cwd(temp.path());

    SecurityConfig config = quietConfig();
    config.pathValidator.allowedRoots = {"./test"};
    SecurityContext context(config);

    const AnalyzeParams params = context.validateAndSanitize(analyzeParams(QStringLiteral("./test")));

    EXPECT_EQ(params.rootDir.toStdString(), (fs::current_path() / "test").string());
    EXPECT_EQ(params.componentName, QStringLiteral("Button"));
    EXPECT_EQ(params.propName, QStringLiteral("onClick"));
}

TEST_F(SecurityContextTest, RejectsRootDirectoryOutsideAllowedRoot)
{
    temp.makeDir("test");
    WorkingDirectory cwd(temp.path());

    SecurityConfig config = quietConfig();
    config.pathValidator.allowedRoots = {"./test"};
    SecurityContext context(config);

    try {
        context.validateAndSanitize(analyzeParams(QStringLiteral("../../etc")));
        FAIL() << "escape from the allowed root";
    } catch (const SecurityException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PathTraversal);
        EXPECT_EQ(e.code(), "PATH_TRAVERSAL_DETECTED");
    }
}

TEST_F(SecurityContextTest, RootDirectoryMustExist)
{
    SecurityConfig config = quietConfig();
    config.pathValidator.allowedRoots = {temp.str()};
    SecurityContext context(config);

    const QString missing = QString::fromStdString((temp.path() / "missing").string());
    try {
        context.validateAndSanitize(analyzeParams(missing));
        FAIL() << "root directory does not exist";
    } catch (const SecurityException& e) {
        EXPECT_EQ(e.code(), "PATH_NOT_FOUND");
    }
}

TEST_F(SecurityContextTest, SanitizerRunsBeforePathCheck)
{
    SecurityConfig config = quietConfig();
    config.pathValidator.allowedRoots = {temp.str()};
    SecurityContext context(config);

    QVariantMap params = analyzeParams(QString::fromStdString(temp.str()));
    params.insert(QStringLiteral("componentName"), QStringLiteral("<script>"));
    try {
        context.validateAndSanitize(params);
        FAIL() << "dangerous component name";
    } catch (const SecurityException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DangerousContent);
    }

    params = analyzeParams(QString::fromStdString(temp.str()));
    params.remove(QStringLiteral("propName"));
    try {
        context.validateAndSanitize(params);
        FAIL() << "missing prop name";
    } catch (const SecurityException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
    }
}

TEST_F(SecurityContextTest, ParserSharesContextLimiter)
{
    SecurityContext context(quietConfig());

    context.sandboxedParser().parseFile("App.jsx", "export default () => <App />;");

    EXPECT_EQ(&context.sandboxedParser().limiter(), &context.resourceLimiter());
    EXPECT_EQ(context.resourceLimiter().usageStats().files.processed, 1u);
}

TEST_F(SecurityContextTest, StatsCombineLimiterAndParser)
{
    SecurityContext context(quietConfig());
    context.sandboxedParser().parseFile("a.js", "a;");

    const QJsonObject stats = context.securityStats();
    ASSERT_TRUE(stats.contains(QStringLiteral("resourceUsage")));
    ASSERT_TRUE(stats.contains(QStringLiteral("parserStats")));
    EXPECT_EQ(stats[QStringLiteral("resourceUsage")][QStringLiteral("files")][QStringLiteral("processed")].toInt(), 1);
    EXPECT_EQ(stats[QStringLiteral("parserStats")][QStringLiteral("filesParsed")].toInt(), 1);

    const QString timestamp = stats[QStringLiteral("timestamp")].toString();
    EXPECT_TRUE(QDateTime::fromString(timestamp, Qt::ISODateWithMs).isValid()) << timestamp.toStdString();

    context.reset();
    const QJsonObject cleared = context.securityStats();
    EXPECT_EQ(cleared[QStringLiteral("resourceUsage")][QStringLiteral("files")][QStringLiteral("processed")].toInt(), 0);
    EXPECT_EQ(cleared[QStringLiteral("parserStats")][QStringLiteral("filesParsed")].toInt(), 0);
}

TEST_F(SecurityContextTest, InjectedGrammarIsUsed)
{
    SecurityContext context(quietConfig(), std::make_shared<FixedGrammar>());

    const ParseResult result = context.sandboxedParser().parseFile("x.js", "anything");
    ASSERT_EQ(result.tree->children.size(), 1u);
    EXPECT_EQ(result.tree->children[0]->kind, "Fixed");
}

TEST_F(SecurityContextTest, DestroyIsIdempotent)
{
    SecurityContext context;
    EXPECT_TRUE(context.resourceLimiter().isMemoryMonitorRunning());

    context.destroy();
    EXPECT_FALSE(context.resourceLimiter().isMemoryMonitorRunning());
    EXPECT_NO_THROW(context.destroy());
}

TEST(SecurityConfigTest, EmptyDocumentKeepsDefaults)
{
    const auto config = SecurityConfig::fromJson(QJsonObject());

    ASSERT_TRUE(config.isSuccess());
    EXPECT_EQ(config->resourceLimiter.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(config->resourceLimiter.maxConcurrentOperations, 5u);
    EXPECT_EQ(config->sandboxedParser.parseTimeout.count(), 5000);
    EXPECT_EQ(config->inputSanitizer.maxNestingDepth, 32);
    EXPECT_TRUE(config->pathValidator.allowedRoots.empty());
}

TEST(SecurityConfigTest, OverridesPresentKeys)
{
    const QJsonObject document{
        {QStringLiteral("pathValidator"), QJsonObject{
            {QStringLiteral("allowedRoots"), QJsonArray{QStringLiteral("/srv/app")}},
            {QStringLiteral("requireExists"), true},
        }},
        {QStringLiteral("inputSanitizer"), QJsonObject{
            {QStringLiteral("maxNestingDepth"), 4},
            {QStringLiteral("componentNamePattern"), QStringLiteral("^[A-Z]\\w*$")},
        }},
        {QStringLiteral("resourceLimiter"), QJsonObject{
            {QStringLiteral("maxFileCount"), 5},
            {QStringLiteral("monitorMemory"), false},
        }},
        {QStringLiteral("sandboxedParser"), QJsonObject{
            {QStringLiteral("parseTimeout"), 250},
            {QStringLiteral("useWorkerThreads"), true},
        }},
        {QStringLiteral("unknownSection"), 1},
    };

    const auto config = SecurityConfig::fromJson(document);

    ASSERT_TRUE(config.isSuccess()) << config.error().describe();
    EXPECT_EQ(config->pathValidator.allowedRoots, std::vector<std::string>{"/srv/app"});
    EXPECT_TRUE(config->pathValidator.requireExists);
    EXPECT_EQ(config->inputSanitizer.maxNestingDepth, 4);
    EXPECT_EQ(config->inputSanitizer.componentNamePattern, QStringLiteral("^[A-Z]\\w*$"));
    EXPECT_EQ(config->resourceLimiter.maxFileCount, 5u);
    EXPECT_FALSE(config->resourceLimiter.monitorMemory);
    EXPECT_EQ(config->resourceLimiter.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(config->sandboxedParser.parseTimeout.count(), 250);
    EXPECT_TRUE(config->sandboxedParser.useWorkerThreads);

    const auto reloaded = SecurityConfig::fromJson(config->toJson());
    ASSERT_TRUE(reloaded.isSuccess());
    EXPECT_EQ(reloaded->resourceLimiter.maxFileCount, 5u);
    EXPECT_EQ(reloaded->sandboxedParser.parseTimeout.count(), 250);
}

TEST(SecurityConfigTest, InvalidValuesNameTheKey)
{
    const auto check = [](const QJsonObject& document, const std::string& context) {
        const auto config = SecurityConfig::fromJson(document);
        ASSERT_TRUE(config.isError()) << context;
        EXPECT_EQ(config.kind(), ErrorKind::InvalidInput);
        EXPECT_EQ(config.code(), "INVALID_CONFIG");
        EXPECT_EQ(config.error().context, context);
    };

    check(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxFileCount"), -1}}}},
          "resourceLimiter.maxFileCount");
    check(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxFileSize"), 1.5}}}},
          "resourceLimiter.maxFileSize");
    check(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("monitorMemory"), QStringLiteral("yes")}}}},
          "resourceLimiter.monitorMemory");
    check(QJsonObject{{QStringLiteral("inputSanitizer"), QJsonObject{{QStringLiteral("componentNamePattern"), QStringLiteral("(")}}}},
          "inputSanitizer.componentNamePattern");
    check(QJsonObject{{QStringLiteral("pathValidator"), QJsonObject{{QStringLiteral("allowedRoots"), QJsonArray{1}}}}},
          "pathValidator.allowedRoots");
    check(QJsonObject{{QStringLiteral("sandboxedParser"), 3}}, "sandboxedParser");
}

TEST(SecurityConfigTest, RejectsOutOfRangeNumbers)
{
    const auto expectInvalid = [](const QJsonObject& document, const std::string& context) {
        const auto config = SecurityConfig::fromJson(document);
        ASSERT_TRUE(config.isError()) << context;
        EXPECT_EQ(config.code(), "INVALID_CONFIG");
        EXPECT_EQ(config.error().context, context);
    };

    // 2^64 and 2^63 are the first doubles past the unsigned and signed ranges
    expectInvalid(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxFileSize"), 1.8446744073709552e19}}}},
                  "resourceLimiter.maxFileSize");
    expectInvalid(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxProcessingTime"), 9.223372036854775808e18}}}},
                  "resourceLimiter.maxProcessingTime");
    expectInvalid(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxASTDepth"), 2147483648.0}}}},
                  "resourceLimiter.maxASTDepth");

    expectInvalid(QJsonObject{{QStringLiteral("sandboxedParser"), QJsonObject{{QStringLiteral("parseTimeout"), 10000000000000.0}}}},
                  "sandboxedParser.parseTimeout");
    expectInvalid(QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("memoryCheckInterval"), 86400001}}}},
                  "resourceLimiter.memoryCheckInterval");

    const auto longest = SecurityConfig::fromJson(
        QJsonObject{{QStringLiteral("sandboxedParser"), QJsonObject{{QStringLiteral("parseTimeout"), 86400000}}}});
    ASSERT_FALSE(longest.isError());
    EXPECT_EQ(longest->sandboxedParser.parseTimeout, std::chrono::hours(24));

    const auto widest = SecurityConfig::fromJson(
        QJsonObject{{QStringLiteral("resourceLimiter"), QJsonObject{{QStringLiteral("maxASTDepth"), 2147483647.0}}}});
    ASSERT_FALSE(widest.isError());
    EXPECT_EQ(widest->resourceLimiter.maxASTDepth, 2147483647);
}

TEST(SecurityConfigTest, LoadFileReportsReadAndSyntaxErrors)
{
    TempDir temp;

    const auto missing = SecurityConfig::loadFile(QString::fromStdString((temp.path() / "none.json").string()));
    EXPECT_EQ(missing.code(), "CONFIG_READ_ERROR");

    const auto broken = temp.writeFile("broken.json", "{ \"resourceLimiter\": ");
    EXPECT_EQ(SecurityConfig::loadFile(QString::fromStdString(broken.string())).code(), "INVALID_CONFIG_JSON");

    const auto array = temp.writeFile("array.json", "[1, 2]");
    EXPECT_EQ(SecurityConfig::loadFile(QString::fromStdString(array.string())).code(), "INVALID_CONFIG_JSON");

    const auto valid = temp.writeFile("kalkan.json", R"({"resourceLimiter": {"maxDirectoryDepth": 3}})");
    const auto loaded = SecurityConfig::loadFile(QString::fromStdString(valid.string()));
    ASSERT_TRUE(loaded.isSuccess()) << loaded.error().describe();
    EXPECT_EQ(loaded->resourceLimiter.maxDirectoryDepth, 3);
}
