#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include <cstdlib>

#include "config/config_store.h"
#include "core/engine.h"
#include "core/log_manager.h"

namespace {

int fail(const DomainFailure& failure)
{
    QTextStream err(stderr);
    err << QJsonDocument(failure.toJson()).toJson(QJsonDocument::Indented);
    err.flush();
    return std::abs(failure.wireValue());
}

int printResult(const Result<QByteArray>& result)
{
    if (!result)
        return fail(result.error());
    QTextStream out(stdout);
    out << QString::fromUtf8(*result);
    out.flush();
    return 0;
}

Result<QByteArray> readInput(const QCommandLineParser& parser, const QString& option)
{
    const QString path = parser.value(option);
    if (path.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_argument"), QStringLiteral("--%1 is required").arg(option)));

    QFile file(path);
    if (path == QStringLiteral("-") ? !file.open(stdin, QIODevice::ReadOnly)
                                    : !file.open(QIODevice::ReadOnly))
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unreadable_file"),
            QStringLiteral("cannot read %1: %2").arg(path, file.errorString())));
    return file.readAll();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("specbridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Translate provider-agnostic prompt specs into provider requests, run them, "
        "and validate spec documents."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("translate | run | validate"));

    const QCommandLineOption configOpt(QStringLiteral("config"), QStringLiteral("Engine configuration file."), QStringLiteral("file"));
    const QCommandLineOption promptOpt(QStringLiteral("prompt"), QStringLiteral("Prompt spec file (translate)."), QStringLiteral("file"));
    const QCommandLineOption providerOpt(QStringLiteral("provider"), QStringLiteral("Provider spec file (translate)."), QStringLiteral("file"));
    const QCommandLineOption modelOpt(QStringLiteral("model"), QStringLiteral("Model id or alias (translate)."), QStringLiteral("id"));
    const QCommandLineOption modeOpt(QStringLiteral("mode"), QStringLiteral("standard|strict for translate, basic|partial|strict for validate."), QStringLiteral("mode"));
    const QCommandLineOption requestOpt(QStringLiteral("request"), QStringLiteral("Provider request document (run)."), QStringLiteral("file"));
    const QCommandLineOption timeoutOpt(QStringLiteral("timeout"), QStringLiteral("Timeout in seconds, 0 for the default (run)."), QStringLiteral("seconds"), QStringLiteral("0"));
    const QCommandLineOption specOpt(QStringLiteral("spec"), QStringLiteral("Spec file to validate."), QStringLiteral("file"));
    const QCommandLineOption typeOpt(QStringLiteral("type"), QStringLiteral("prompt_spec|provider_spec (validate)."), QStringLiteral("type"));
    const QCommandLineOption verboseOpt({QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Log at debug level."));
    parser.addOptions({configOpt, promptOpt, providerOpt, modelOpt, modeOpt, requestOpt,
                       timeoutOpt, specOpt, typeOpt, verboseOpt});
    parser.process(app);

    ConfigStore configStore;
    if (parser.isSet(configOpt)) {
        if (!configStore.load(parser.value(configOpt)))
            return fail(DomainFailure::invalidInput(
                QStringLiteral("unreadable_config"),
                QStringLiteral("cannot load config %1").arg(parser.value(configOpt))));
    } else {
        // No file: defaults plus environment overrides.
        configStore.load(QString());
    }
    const EngineConfig config = configStore.engineConfig();

    LogManager& logger = LogManager::instance();
    logger.initialize(config.logDir);
    logger.setMinimumLevel(parser.isSet(verboseOpt) || config.debugMode
                            ? LogManager::Debug
                            : LogManager::levelFromName(config.logLevel));
    logger.setConsoleEcho(parser.isSet(verboseOpt));

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(2);
    }
    const QString command = args.first();
    const Engine engine(config);

    if (command == QStringLiteral("translate")) {
        auto prompt = readInput(parser, QStringLiteral("prompt"));
        if (!prompt)
            return fail(prompt.error());
        auto provider = readInput(parser, QStringLiteral("provider"));
        if (!provider)
            return fail(provider.error());
        const QString mode = parser.isSet(modeOpt) ? parser.value(modeOpt) : QStringLiteral("standard");
        return printResult(engine.translate(*prompt, *provider, parser.value(modelOpt), mode));
    }

    if (command == QStringLiteral("run")) {
        auto request = readInput(parser, QStringLiteral("request"));
        if (!request)
            return fail(request.error());
        bool ok = false;
        const int timeout = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || timeout < 0)
            return fail(DomainFailure::invalidInput(
                QStringLiteral("invalid_timeout"),
                QStringLiteral("--timeout expects a non-negative integer")));
        return printResult(engine.run(*request, timeout));
    }

    if (command == QStringLiteral("validate")) {
        auto spec = readInput(parser, QStringLiteral("spec"));
        if (!spec)
            return fail(spec.error());
        const QString mode = parser.isSet(modeOpt) ? parser.value(modeOpt) : QStringLiteral("basic");
        return printResult(engine.validate(*spec, parser.value(typeOpt), mode));
    }

    return fail(DomainFailure::invalidInput(
        QStringLiteral("unknown_command"),
        QStringLiteral("unknown command '%1' (expected translate, run or validate)").arg(command)));
}
