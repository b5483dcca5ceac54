#include "kscope/session_controller.hpp"

#include <QDir>
#include <QStandardPaths>

#include <cstdio>

#include "kscope/channel_client.hpp"
#include "kscope/telemetry.hpp"

namespace kscope {

std::atomic<bool> SessionController::interruptRequested_{false};

namespace {

constexpr int kInterruptPollMs = 200;
constexpr int kThreadJoinSlackMs = 1000;

}  // namespace

SessionController::SessionController(
    const SessionOptions& options,
    const Clock* clock,
    QObject* parent)
    : QObject(parent),
      options_(options),
      clock_(clock),
      out_(stdout),
      err_(stderr) {
    durationTimer_.setSingleShot(true);
    connect(&durationTimer_, &QTimer::timeout, this, [this]() { stop(StopReason::Duration); });

    interruptTimer_.setInterval(kInterruptPollMs);
    connect(&interruptTimer_, &QTimer::timeout, this, &SessionController::pollInterrupt);

    intervalCaptureTimer_.setSingleShot(true);
    connect(&intervalCaptureTimer_, &QTimer::timeout, this, [this]() {
        if (!finished_ && captureWorker_ != nullptr) {
            QMetaObject::invokeMethod(captureWorker_, "runInterval", Qt::QueuedConnection);
        }
    });
}

SessionController::~SessionController() {
    stopThreads();
    log_.close();
}

void SessionController::requestInterrupt() {
    interruptRequested_.store(true);
}

void SessionController::clearInterrupt() {
    interruptRequested_.store(false);
}

QJsonObject SessionController::fail(const QString& error) const {
    return {
        {"success", false},
        {"error", error},
    };
}

QJsonObject SessionController::prepare() {
    const QString invalid = options_.validate();
    if (!invalid.isEmpty()) {
        return fail(invalid);
    }

    ChannelInfo info;
    if (options_.chatroomId) {
        chatroomId_ = *options_.chatroomId;
    } else {
        ChannelClient client(options_.proxy);
        const QJsonObject resolved = client.resolve(options_.channel, &info);
        if (!resolved.value("success").toBool(false)) {
            return fail(QString("Failed to resolve channel: %1").arg(resolved.value("error").toString()));
        }
        chatroomId_ = info.chatroomId;
        initialViewers_ = info.viewerCount;
    }
    if (chatroomId_ <= 0) {
        return fail("Chatroom id not found");
    }

    const qint64 startMs = clock_->nowMs();
    logPath_ = options_.logPath.isEmpty()
        ? defaultLogPath(options_.sessionLabel(), startMs)
        : options_.logPath;

    if (options_.capturesEnabled()) {
        streamUrl_ = options_.streamUrl;
        if (streamUrl_.isEmpty() && !options_.channel.isEmpty()) {
            streamUrl_ = info.streamUrl;
            if (streamUrl_.isEmpty()) {
                ChannelClient client;
                streamUrl_ = client.resolveStreamUrl(options_.channel);
            }
        }
        if (streamUrl_.isEmpty()) {
            return fail("Screenshot enabled but stream URL is missing. Use --stream-url.");
        }
        captureDir_ = options_.screenshotDir.isEmpty()
            ? defaultCaptureDir(logPath_)
            : options_.screenshotDir;
        if (!QDir().mkpath(captureDir_)) {
            return fail(QString("Failed to create screenshot directory: %1").arg(captureDir_));
        }
        const QJsonObject tool = resolveCaptureTool();
        if (!tool.value("success").toBool(false)) {
            return tool;
        }
    }

    const QJsonObject opened = log_.open(logPath_);
    if (!opened.value("success").toBool(false)) {
        return opened;
    }

    state_ = std::make_unique<SessionState>(startMs, initialViewers_);
    records_ = std::make_unique<RecordBuilder>(options_.channelTag(), options_.screenshotEmbed);

    out_ << "Logging to " << logPath_ << Qt::endl;
    log_.append(records_->sessionStart(chatroomId_, clock_->nowMs()));

    Telemetry::instance().recordEvent("session_prepared", {
        {"chatroom_id", static_cast<double>(chatroomId_)},
        {"log", logPath_},
        {"options", options_.toJson()},
    });
    prepared_ = true;
    return {
        {"success", true},
        {"path", logPath_},
    };
}

QJsonObject SessionController::resolveCaptureTool() {
    toolPath_ = options_.ffmpegPath.isEmpty()
        ? QStandardPaths::findExecutable("ffmpeg")
        : options_.ffmpegPath;
    if (toolPath_.isEmpty()) {
        return fail("ffmpeg not found. Install it or pass --ffmpeg-path to the executable.");
    }
    return {{"success", true}};
}

void SessionController::start() {
    if (!prepared_ || started_) {
        return;
    }
    started_ = true;

    feed_ = new ChatFeed(chatroomId_, options_.feedUrl, this);
    connect(feed_, &ChatFeed::messageReceived, this, &SessionController::onMessage);

    SnapshotScheduler::Settings settings;
    settings.inactivitySec = options_.inactivitySec;
    settings.durationSec = options_.durationSec;
    settings.captureOnSnapshot = options_.screenshotOnSnapshot;
    settings.useColor = useColor_;
    scheduler_ = new SnapshotScheduler(settings, state_.get(), &log_, records_.get(), clock_, this);
    connect(scheduler_, &SnapshotScheduler::statusLine, this, &SessionController::onStatusLine);
    connect(scheduler_, &SnapshotScheduler::captureRequested, this, &SessionController::onCaptureRequested);
    connect(scheduler_, &SnapshotScheduler::stopRequested, this, &SessionController::stop);

    if (options_.capturesEnabled()) {
        startCapture();
    }
    if (!options_.channel.isEmpty()) {
        startViewerPoller();
    }

    interruptTimer_.start();
    if (options_.durationSec) {
        durationTimer_.start(static_cast<int>(static_cast<qint64>(*options_.durationSec) * 1000));
    }
    feed_->start();
    scheduler_->start();
    if (options_.screenshotIntervalSec && !finished_) {
        QMetaObject::invokeMethod(captureWorker_, "runInterval", Qt::QueuedConnection);
    }
}

void SessionController::startCapture() {
    CaptureSettings settings;
    settings.toolPath = toolPath_;
    settings.sourceUrl = streamUrl_;
    settings.outputDir = captureDir_;
    settings.label = options_.sessionLabel();
    settings.format = options_.screenshotFormat;
    settings.maxRetained = options_.screenshotMax.value_or(0);
    settings.embedThumbnail = options_.screenshotEmbed;
    settings.thumbnailWidth = options_.screenshotEmbedWidth;
    capture_ = std::make_unique<CaptureCoordinator>(settings, state_.get(), clock_);

    captureThread_ = new QThread(this);
    captureWorker_ = new CaptureWorker(capture_.get());
    captureWorker_->moveToThread(captureThread_);
    connect(captureThread_, &QThread::finished, captureWorker_, &QObject::deleteLater);
    connect(
        captureWorker_,
        &CaptureWorker::captureFinished,
        this,
        &SessionController::onCaptureFinished,
        Qt::QueuedConnection);
    captureThread_->start();
}

void SessionController::startViewerPoller() {
    pollerThread_ = new QThread(this);
    poller_ = new ViewerPoller(state_.get(), options_.channel, viewerFetcher_);
    poller_->moveToThread(pollerThread_);
    connect(pollerThread_, &QThread::started, poller_, &ViewerPoller::start);
    connect(pollerThread_, &QThread::finished, poller_, &QObject::deleteLater);
    pollerThread_->start();
}

void SessionController::onMessage(const QString& username, const QString& content) {
    if (finished_) {
        return;
    }
    const qint64 nowMs = clock_->nowMs();
    state_->recordMessage(username, nowMs);
    log_.append(records_->message(username, content, nowMs));
}

void SessionController::onStatusLine(const QString& line) {
    out_ << '\r' << line << "    ";
    out_.flush();
}

void SessionController::onCaptureRequested() {
    if (captureWorker_ != nullptr && !finished_) {
        captureWorker_->triggerIfIdle();
    }
}

void SessionController::onCaptureFinished(const CaptureResult& result) {
    if (finished_) {
        return;
    }
    if (result.status == CaptureStatus::ToolMissing) {
        stop(StopReason::CaptureToolMissing);
        return;
    }
    if (options_.screenshotIntervalSec) {
        intervalCaptureTimer_.start(static_cast<int>(static_cast<qint64>(*options_.screenshotIntervalSec) * 1000));
    }
}

void SessionController::pollInterrupt() {
    if (interruptRequested_.exchange(false)) {
        stop(StopReason::Interrupted);
    }
}

void SessionController::stop(StopReason reason) {
    if (finished_ || reason == StopReason::None) {
        return;
    }
    finished_ = true;
    stopReason_ = reason;

    switch (reason) {
        case StopReason::Duration:
            out_ << "\nStopping after " << options_.durationSec.value_or(0) << "s duration." << Qt::endl;
            break;
        case StopReason::Inactivity:
            out_ << "\nStopping after " << options_.inactivitySec.value_or(0) << "s inactivity." << Qt::endl;
            break;
        case StopReason::Interrupted:
            out_ << "\nStopping..." << Qt::endl;
            break;
        case StopReason::CaptureToolMissing:
            out_.flush();
            err_ << "\nffmpeg not found. Install ffmpeg or disable screenshots." << Qt::endl;
            exitCode_ = 1;
            break;
        case StopReason::None:
            break;
    }

    if (scheduler_ != nullptr) {
        scheduler_->stop();
    }
    if (feed_ != nullptr) {
        feed_->stop();
    }
    durationTimer_.stop();
    interruptTimer_.stop();
    intervalCaptureTimer_.stop();
    stopThreads();

    Telemetry::instance().recordEvent("session_stopped", {
        {"reason", stopReasonName(reason)},
        {"total_messages", state_ ? static_cast<double>(state_->totalMessages()) : 0.0},
        {"records", static_cast<double>(log_.recordCount())},
        {"exit_code", exitCode_},
    });
    log_.close();
    emit finished(exitCode_);
}

void SessionController::stopThreads() {
    // Joining the capture thread waits out an in-flight capture. The runner
    // kills the tool at its timeout, so the worker always returns.
    if (captureThread_ != nullptr) {
        captureThread_->quit();
        const int boundMs = capture_->worstCaseRunMs() + kThreadJoinSlackMs;
        if (!captureThread_->wait(boundMs)) {
            Telemetry::instance().recordEvent("capture_join_overrun", {{"bound_ms", boundMs}});
            captureThread_->wait();
        }
        captureThread_ = nullptr;
        captureWorker_ = nullptr;
    }
    if (pollerThread_ != nullptr) {
        pollerThread_->quit();
        pollerThread_->wait();
        pollerThread_ = nullptr;
        poller_ = nullptr;
    }
}

}  // namespace kscope
