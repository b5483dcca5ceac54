#include "kscope/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>

#include "kscope/telemetry.hpp"

namespace kscope {

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();

    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs)) {
        if (process.error() == QProcess::FailedToStart) {
            result.failedToStart = true;
            result.stderrText = QString("Failed to start %1: %2").arg(program, process.errorString());
        } else {
            process.kill();
            process.waitForFinished(kKillGraceMs);
            result.timedOut = true;
            result.stderrText = "Process did not start in time.";
        }
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(kKillGraceMs);
        result.timedOut = true;
        result.stderrText = "Command timed out.";
        Telemetry::instance().incrementCounter("commands.timeouts");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutData = process.readAllStandardOutput();
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    Telemetry::instance().incrementCounter("commands.count");
    if (result.exitCode != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

}  // namespace kscope
