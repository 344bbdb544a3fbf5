#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QTextStream>

#include "core/config/securityconfig.hpp"
#include "core/errors/securityerror.hpp"
#include "core/scan/sourcescanner.hpp"
#include "core/securitycontext.hpp"

using namespace Kalkan::Core;

namespace {

constexpr int kExitTaxonomyError = 1;
constexpr int kExitUsageError = 2;

// Accepts any JSON value; anything that is not JSON is taken as a plain string
QVariant parsePropValue(const QString& text)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(
        QStringLiteral("[%1]").arg(text).toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || document.array().size() != 1) {
        return text;
    }
    return document.array().first().toVariant();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("kalkan-check"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Validates an analyze request and parses the JavaScript/TypeScript sources under its root."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption rootOption({QStringLiteral("r"), QStringLiteral("root")},
                                        QStringLiteral("Root directory to scan."), QStringLiteral("dir"));
    const QCommandLineOption componentOption({QStringLiteral("c"), QStringLiteral("component")},
                                             QStringLiteral("Component name. Validated, not used for matching."), QStringLiteral("name"));
    const QCommandLineOption propOption({QStringLiteral("p"), QStringLiteral("prop")},
                                        QStringLiteral("Attribute name. Validated, not used for matching."), QStringLiteral("name"));
    const QCommandLineOption valueOption(QStringLiteral("value"),
                                         QStringLiteral("Attribute value as JSON or plain text. Validated, not used for matching."),
                                         QStringLiteral("value"));
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("JSON configuration file."), QStringLiteral("file"));
    const QCommandLineOption allowedRootOption(QStringLiteral("allowed-root"),
                                               QStringLiteral("Directory the root must lie in. Repeatable."),
                                               QStringLiteral("dir"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Enable debug logging."));

    parser.addOptions({rootOption, componentOption, propOption, valueOption,
                       configOption, allowedRootOption, verboseOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("kalkan.*.debug=true"));
    }

    if (!parser.isSet(rootOption) || !parser.isSet(componentOption) || !parser.isSet(propOption)) {
        err << "kalkan-check: --root, --component and --prop are required\n\n" << parser.helpText();
        return kExitUsageError;
    }

    SecurityConfig config;
    if (parser.isSet(configOption)) {
        const auto loaded = SecurityConfig::loadFile(parser.value(configOption));
        if (!loaded) {
            err << "kalkan-check: " << QString::fromStdString(loaded.error().describe()) << "\n";
            return kExitTaxonomyError;
        }
        config = loaded.value();
    }
    for (const QString& root : parser.values(allowedRootOption)) {
        config.pathValidator.allowedRoots.push_back(root.toStdString());
    }

    QVariantMap params;
    params.insert(QStringLiteral("rootDir"), parser.value(rootOption));
    params.insert(QStringLiteral("componentName"), parser.value(componentOption));
    params.insert(QStringLiteral("propName"), parser.value(propOption));
    if (parser.isSet(valueOption)) {
        params.insert(QStringLiteral("propValue"), parsePropValue(parser.value(valueOption)));
    }
    params.insert(QStringLiteral("verbose"), parser.isSet(verboseOption));

    SecurityContext context(config);

    try {
        const AnalyzeParams request = context.validateAndSanitize(params);

        SourceScanner scanner(context.sandboxedParser());
        const ScanReport report = scanner.scan(request.rootDir.toStdString());

        out << "Root:      " << request.rootDir << "\n"
            << "Component: " << request.componentName << "\n"
            << "Prop:      " << request.propName << "\n\n";

        for (const auto& result : report.parsed.results) {
            const ParseMetadata& meta = result.metadata;
            out << "  ok    " << QString::fromStdString(meta.filePath)
                << "  nodes=" << meta.treeStats.nodeCount
                << " depth=" << meta.treeStats.maxDepth
                << " " << QString::fromStdString(meta.sourceKind);
            if (meta.permissiveRetry) {
                out << " (permissive)";
            }
            if (!result.findings.empty()) {
                out << " findings=" << result.findings.size();
            }
            out << "\n";
        }
        for (const auto& failure : report.parsed.errors) {
            out << "  FAIL  " << QString::fromStdString(failure.path)
                << "  " << QString::fromStdString(failure.error.describe()) << "\n";
        }
        for (const auto& directory : report.unreadableDirectories) {
            out << "  SKIP  " << QString::fromStdString(directory) << "\n";
        }

        out << "\n" << QJsonDocument(context.securityStats()).toJson(QJsonDocument::Indented);
        out.flush();

        return report.parsed.errors.empty() ? 0 : kExitTaxonomyError;
    } catch (const SecurityException& e) {
        err << "kalkan-check: " << e.what() << "\n";
        return kExitTaxonomyError;
    }
}
