#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>
#include <QTimer>

#include <csignal>
#include <cstdio>

#include <unistd.h>

#include "kscope/session_controller.hpp"
#include "kscope/session_export.hpp"
#include "kscope/session_options.hpp"
#include "kscope/telemetry.hpp"

namespace {

void handleSigint(int) {
    kscope::SessionController::requestInterrupt();
}

int printFailure(const QJsonObject& result) {
    QTextStream err(stderr);
    err << result.value("error").toString() << Qt::endl;
    return 1;
}

int runExport(const QCommandLineParser& parser, bool messages) {
    if (!parser.isSet("input")) {
        QTextStream err(stderr);
        err << "--input is required." << Qt::endl;
        return 1;
    }
    const QString input = parser.value("input");
    const QString output = parser.value("output");
    const QJsonObject result = messages
        ? kscope::exportMessagesCsv(input, output)
        : kscope::exportSnapshotsCsv(input, output);
    if (!result.value("success").toBool(false)) {
        return printFailure(result);
    }
    QTextStream out(stdout);
    out << "Wrote " << result.value("path").toString() << Qt::endl;
    return 0;
}

int runSession(QCoreApplication& app, const QCommandLineParser& parser) {
    kscope::SessionOptions options;
    const QString parseError = kscope::applyCommandLine(parser, &options);
    if (!parseError.isEmpty()) {
        return printFailure({{"error", parseError}});
    }

    kscope::SessionController controller(options);
    controller.setUseColor(isatty(STDOUT_FILENO) != 0);
    const QJsonObject prepared = controller.prepare();
    if (!prepared.value("success").toBool(false)) {
        return printFailure(prepared);
    }

    QObject::connect(&controller, &kscope::SessionController::finished, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });
    std::signal(SIGINT, handleSigint);
    QTimer::singleShot(0, &controller, &kscope::SessionController::start);
    return app.exec();
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("kickscope");
    app.setApplicationVersion("1.0");
    QObject::connect(&app, &QCoreApplication::aboutToQuit, []() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        kscope::Telemetry::instance().exportToFile(path);
    });

    QCommandLineParser parser;
    parser.setApplicationDescription("Kick chat analytics CLI");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "run | export-csv | export-messages");
    kscope::addRunOptions(parser);
    parser.addOptions({
        {"input", "Session JSONL input (export commands).", "path"},
        {"output", "CSV output path (export commands).", "path"},
    });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    if (command == "run") {
        return runSession(app, parser);
    }
    if (command == "export-csv") {
        return runExport(parser, false);
    }
    if (command == "export-messages") {
        return runExport(parser, true);
    }
    QTextStream err(stderr);
    err << "Unknown command: " << command << Qt::endl;
    return 1;
}
