#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QTextStream>
#include <QThread>
#include <QTimer>

#include <atomic>
#include <memory>

#include "kscope/capture_coordinator.hpp"
#include "kscope/chat_feed.hpp"
#include "kscope/clock.hpp"
#include "kscope/record_builder.hpp"
#include "kscope/session_log.hpp"
#include "kscope/session_options.hpp"
#include "kscope/session_state.hpp"
#include "kscope/snapshot_scheduler.hpp"
#include "kscope/viewer_poller.hpp"

namespace kscope {

// Owns one monitoring session: resolves the chatroom, opens the log, starts
// the feed, the scheduler, the viewer poller and the capture worker, and
// tears all of them down on the first stop condition.
class SessionController final : public QObject {
    Q_OBJECT

public:
    explicit SessionController(
        const SessionOptions& options,
        const Clock* clock = &SystemClock::instance(),
        QObject* parent = nullptr);
    ~SessionController() override;

    // Startup checks and resources. Nothing runs yet when this fails.
    QJsonObject prepare();
    void start();
    void stop(StopReason reason);

    void setUseColor(bool enabled) { useColor_ = enabled; }
    void setViewerFetcher(ViewerPoller::Fetcher fetcher) { viewerFetcher_ = std::move(fetcher); }

    [[nodiscard]] const SessionOptions& options() const { return options_; }
    [[nodiscard]] QString logPath() const { return logPath_; }
    [[nodiscard]] QString captureDir() const { return captureDir_; }
    [[nodiscard]] QString streamUrl() const { return streamUrl_; }
    [[nodiscard]] qint64 chatroomId() const { return chatroomId_; }
    [[nodiscard]] SessionState* state() const { return state_.get(); }
    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] StopReason stopReason() const { return stopReason_; }
    [[nodiscard]] int exitCode() const { return exitCode_; }

    // Async-signal-safe; picked up by the running session within 200 ms.
    static void requestInterrupt();
    static void clearInterrupt();

signals:
    void finished(int exitCode);

private slots:
    void onMessage(const QString& username, const QString& content);
    void onStatusLine(const QString& line);
    void onCaptureRequested();
    void onCaptureFinished(const kscope::CaptureResult& result);
    void pollInterrupt();

private:
    QJsonObject fail(const QString& error) const;
    QJsonObject resolveCaptureTool();
    void startCapture();
    void startViewerPoller();
    void stopThreads();

    static std::atomic<bool> interruptRequested_;

    SessionOptions options_;
    const Clock* clock_ = nullptr;
    bool useColor_ = false;
    ViewerPoller::Fetcher viewerFetcher_;

    qint64 chatroomId_ = 0;
    std::optional<qint64> initialViewers_;
    QString logPath_;
    QString captureDir_;
    QString streamUrl_;
    QString toolPath_;

    std::unique_ptr<SessionState> state_;
    std::unique_ptr<RecordBuilder> records_;
    SessionLog log_;
    std::unique_ptr<CaptureCoordinator> capture_;

    ChatFeed* feed_ = nullptr;
    SnapshotScheduler* scheduler_ = nullptr;
    CaptureWorker* captureWorker_ = nullptr;
    QThread* captureThread_ = nullptr;
    ViewerPoller* poller_ = nullptr;
    QThread* pollerThread_ = nullptr;

    QTimer durationTimer_;
    QTimer interruptTimer_;
    QTimer intervalCaptureTimer_;

    QTextStream out_;
    QTextStream err_;

    bool prepared_ = false;
    bool started_ = false;
    bool finished_ = false;
    StopReason stopReason_ = StopReason::None;
    int exitCode_ = 0;
};

}  // namespace kscope
