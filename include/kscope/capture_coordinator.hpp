#pragma once

#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QStringList>

#include <atomic>

#include "kscope/clock.hpp"
#include "kscope/session_state.hpp"

namespace kscope {

struct CaptureSettings {
    QString toolPath;
    QString sourceUrl;
    QString outputDir;
    QString label;
    QString format = "jpg";
    int maxRetained = 0;
    bool embedThumbnail = false;
    int thumbnailWidth = 160;
    int captureTimeoutMs = 15000;
    int thumbnailTimeoutMs = 10000;
};

enum class CaptureStatus {
    Captured,
    Skipped,
    Failed,
    TimedOut,
    ToolMissing,
};

struct CaptureResult {
    CaptureStatus status = CaptureStatus::Failed;
    QString path;
    QString error;
    bool thumbnailEmbedded = false;

    [[nodiscard]] bool success() const { return status == CaptureStatus::Captured; }
};

// Runs the external single-frame capture tool and publishes what it produced
// into SessionState. At most one capture is in flight; a caller that finds
// one running gets Skipped back instead of queueing.
class CaptureCoordinator {
public:
    CaptureCoordinator(const CaptureSettings& settings, SessionState* state, const Clock* clock);

    CaptureCoordinator(const CaptureCoordinator&) = delete;
    CaptureCoordinator& operator=(const CaptureCoordinator&) = delete;

    // Claims the in-flight slot. Pair a successful claim with runReserved().
    bool tryReserve();
    CaptureResult runReserved();
    CaptureResult captureOnce();

    [[nodiscard]] bool inFlight() const { return inFlight_.load(); }
    [[nodiscard]] QStringList retainedPaths() const;
    [[nodiscard]] const CaptureSettings& settings() const { return settings_; }
    // Upper bound on one capture including its thumbnail.
    [[nodiscard]] int worstCaseRunMs() const;

    QStringList captureArguments(const QString& outputPath) const;
    QStringList thumbnailArguments(const QString& capturePath) const;
    QString outputPathFor(qint64 atMs) const;

private:
    CaptureResult runCapture();
    void retain(const QString& path);
    bool embedThumbnail(const QString& capturePath);

    const CaptureSettings settings_;
    SessionState* state_ = nullptr;
    const Clock* clock_ = nullptr;
    std::atomic<bool> inFlight_{false};

    mutable QMutex retainedMutex_;
    QQueue<QString> retained_;
};

// Owns a CaptureCoordinator on a background thread so the tick loop and the
// feed never wait on the capture tool.
class CaptureWorker final : public QObject {
    Q_OBJECT

public:
    explicit CaptureWorker(CaptureCoordinator* coordinator, QObject* parent = nullptr);

    // Queues a capture unless one is already running. Thread-safe.
    bool triggerIfIdle();

public slots:
    void runReserved();
    void runInterval();

signals:
    void captureFinished(const kscope::CaptureResult& result);

private:
    CaptureCoordinator* coordinator_ = nullptr;
};

}  // namespace kscope

Q_DECLARE_METATYPE(kscope::CaptureResult)
