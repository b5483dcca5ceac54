#include "kscope/snapshot_scheduler.hpp"

#include <QElapsedTimer>

#include "kscope/status_line.hpp"
#include "kscope/telemetry.hpp"

namespace kscope {

QString stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::None:
            return "none";
        case StopReason::Duration:
            return "duration";
        case StopReason::Inactivity:
            return "inactivity";
        case StopReason::Interrupted:
            return "interrupted";
        case StopReason::CaptureToolMissing:
            return "capture_tool_missing";
    }
    return "unknown";
}

SnapshotScheduler::SnapshotScheduler(
    const Settings& settings,
    SessionState* state,
    SessionLog* log,
    const RecordBuilder* records,
    const Clock* clock,
    QObject* parent)
    : QObject(parent),
      settings_(settings),
      session_(state),
      log_(log),
      records_(records),
      clock_(clock) {
    timer_.setInterval(settings_.intervalMs);
    connect(&timer_, &QTimer::timeout, this, &SnapshotScheduler::tick);
}

void SnapshotScheduler::start() {
    if (state_ != State::Idle) {
        return;
    }
    state_ = State::Ticking;
    timer_.start();
    tick();
}

void SnapshotScheduler::stop() {
    state_ = State::Stopping;
    timer_.stop();
}

StopReason SnapshotScheduler::tick() {
    if (state_ != State::Ticking) {
        return StopReason::None;
    }
    QElapsedTimer elapsed;
    elapsed.start();

    const qint64 nowMs = clock_->nowMs();
    const SessionView view = session_->snapshot(nowMs);
    emit statusLine(renderStatusLine(view, settings_.useColor));
    log_->append(records_->snapshot(view, nowMs));
    if (settings_.captureOnSnapshot) {
        emit captureRequested();
    }
    tickCount_++;
    Telemetry::instance().incrementCounter("scheduler.ticks");
    Telemetry::instance().recordDurationMs("scheduler.tick_ms", elapsed.elapsed());

    const StopReason reason = evaluateStop(view, nowMs);
    if (reason != StopReason::None) {
        stop();
        emit stopRequested(reason);
    }
    return reason;
}

StopReason SnapshotScheduler::evaluateStop(const SessionView& view, qint64 nowMs) const {
    if (settings_.inactivitySec
        && nowMs - view.lastMessageMs >= static_cast<qint64>(*settings_.inactivitySec) * 1000) {
        return StopReason::Inactivity;
    }
    if (settings_.durationSec
        && nowMs - view.startedAtMs >= static_cast<qint64>(*settings_.durationSec) * 1000) {
        return StopReason::Duration;
    }
    return StopReason::None;
}

}  // namespace kscope
