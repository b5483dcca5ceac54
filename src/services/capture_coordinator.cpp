#include "kscope/capture_coordinator.hpp"

#include <QDir>
#include <QFile>
#include <QMutexLocker>

#include "kscope/command_runner.hpp"
#include "kscope/telemetry.hpp"

namespace kscope {

CaptureCoordinator::CaptureCoordinator(
    const CaptureSettings& settings,
    SessionState* state,
    const Clock* clock)
    : settings_(settings),
      state_(state),
      clock_(clock) {}

bool CaptureCoordinator::tryReserve() {
    bool expected = false;
    return inFlight_.compare_exchange_strong(expected, true);
}

CaptureResult CaptureCoordinator::runReserved() {
    const CaptureResult result = runCapture();
    inFlight_.store(false);
    return result;
}

CaptureResult CaptureCoordinator::captureOnce() {
    if (!tryReserve()) {
        Telemetry::instance().incrementCounter("capture.skipped_in_flight");
        CaptureResult skipped;
        skipped.status = CaptureStatus::Skipped;
        return skipped;
    }
    return runReserved();
}

int CaptureCoordinator::worstCaseRunMs() const {
    int bound = CommandRunner::worstCaseMs(settings_.captureTimeoutMs);
    if (settings_.embedThumbnail) {
        bound += CommandRunner::worstCaseMs(settings_.thumbnailTimeoutMs);
    }
    return bound;
}

QStringList CaptureCoordinator::retainedPaths() const {
    QMutexLocker lock(&retainedMutex_);
    return QStringList(retained_.begin(), retained_.end());
}

QString CaptureCoordinator::outputPathFor(qint64 atMs) const {
    const QString fileName =
        QString("%1-%2.%3").arg(settings_.label, utcFileStamp(atMs), settings_.format);
    return QDir(settings_.outputDir).filePath(fileName);
}

QStringList CaptureCoordinator::captureArguments(const QString& outputPath) const {
    return {
        "-y",
        "-loglevel", "error",
        "-i", settings_.sourceUrl,
        "-frames:v", "1",
        "-vf", "scale=-2:480",
        outputPath,
    };
}

QStringList CaptureCoordinator::thumbnailArguments(const QString& capturePath) const {
    return {
        "-loglevel", "error",
        "-i", capturePath,
        "-frames:v", "1",
        "-vf", QString("scale=%1:-2").arg(settings_.thumbnailWidth),
        "-f", "image2pipe",
        "-vcodec", "mjpeg",
        "-",
    };
}

CaptureResult CaptureCoordinator::runCapture() {
    const qint64 startedMs = clock_->nowMs();
    const QString outputPath = outputPathFor(startedMs);

    const CommandResult command =
        CommandRunner::run(settings_.toolPath, captureArguments(outputPath), settings_.captureTimeoutMs);

    CaptureResult result;
    result.path = outputPath;
    if (command.failedToStart) {
        result.status = CaptureStatus::ToolMissing;
        result.error = command.stderrText;
        Telemetry::instance().recordEvent("capture_failed", {
            {"reason", "tool_missing"},
            {"tool", settings_.toolPath},
        });
        return result;
    }
    if (command.timedOut) {
        result.status = CaptureStatus::TimedOut;
        result.error = command.stderrText;
        Telemetry::instance().incrementCounter("capture.timeouts");
        Telemetry::instance().recordEvent("capture_failed", {
            {"reason", "timeout"},
            {"path", outputPath},
        });
        return result;
    }
    if (command.exitCode != 0) {
        result.status = CaptureStatus::Failed;
        result.error = command.stderrText.trimmed();
        Telemetry::instance().incrementCounter("capture.non_zero_exit");
        Telemetry::instance().recordEvent("capture_failed", {
            {"reason", "exit_code"},
            {"exit_code", command.exitCode},
            {"stderr", result.error.left(400)},
        });
        return result;
    }

    state_->publishCapture({outputPath, clock_->nowMs()});
    if (settings_.maxRetained > 0) {
        retain(outputPath);
    }
    Telemetry::instance().incrementCounter("capture.count");

    result.status = CaptureStatus::Captured;
    if (settings_.embedThumbnail) {
        result.thumbnailEmbedded = embedThumbnail(outputPath);
    }
    return result;
}

void CaptureCoordinator::retain(const QString& path) {
    QMutexLocker lock(&retainedMutex_);
    // A capture landing in the same second overwrites the previous file.
    retained_.removeAll(path);
    retained_.enqueue(path);
    while (retained_.size() > settings_.maxRetained) {
        const QString oldest = retained_.dequeue();
        if (!QFile::remove(oldest)) {
            Telemetry::instance().incrementCounter("capture.retention_delete_failures");
            continue;
        }
        Telemetry::instance().incrementCounter("capture.retention_evictions");
    }
}

bool CaptureCoordinator::embedThumbnail(const QString& capturePath) {
    const CommandResult command = CommandRunner::run(
        settings_.toolPath,
        thumbnailArguments(capturePath),
        settings_.thumbnailTimeoutMs);
    if (!command.success() || command.stdoutData.isEmpty()) {
        Telemetry::instance().incrementCounter("capture.thumbnail_failures");
        return false;
    }
    state_->publishThumbnail(QString::fromLatin1(command.stdoutData.toBase64()));
    return true;
}

CaptureWorker::CaptureWorker(CaptureCoordinator* coordinator, QObject* parent)
    : QObject(parent),
      coordinator_(coordinator) {
    qRegisterMetaType<kscope::CaptureResult>();
}

bool CaptureWorker::triggerIfIdle() {
    if (!coordinator_->tryReserve()) {
        Telemetry::instance().incrementCounter("capture.skipped_in_flight");
        return false;
    }
    QMetaObject::invokeMethod(this, "runReserved", Qt::QueuedConnection);
    return true;
}

void CaptureWorker::runReserved() {
    emit captureFinished(coordinator_->runReserved());
}

void CaptureWorker::runInterval() {
    emit captureFinished(coordinator_->captureOnce());
}

}  // namespace kscope
