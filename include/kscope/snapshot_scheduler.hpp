#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <optional>

#include "kscope/clock.hpp"
#include "kscope/record_builder.hpp"
#include "kscope/session_log.hpp"
#include "kscope/session_state.hpp"

namespace kscope {

enum class StopReason {
    None,
    Duration,
    Inactivity,
    Interrupted,
    CaptureToolMissing,
};

QString stopReasonName(StopReason reason);

// Fixed-cadence reporting loop. Every tick queries the shared state, renders
// the status line, persists one snapshot record, optionally asks for a
// capture and then evaluates the time-based stop conditions.
class SnapshotScheduler final : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Ticking,
        Stopping,
    };

    struct Settings {
        std::optional<int> inactivitySec;
        std::optional<int> durationSec;
        bool captureOnSnapshot = false;
        int intervalMs = 1000;
        bool useColor = false;
    };

    SnapshotScheduler(
        const Settings& settings,
        SessionState* state,
        SessionLog* log,
        const RecordBuilder* records,
        const Clock* clock,
        QObject* parent = nullptr);

    void start();
    void stop();
    StopReason tick();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] int tickCount() const { return tickCount_; }

signals:
    void statusLine(const QString& line);
    void captureRequested();
    void stopRequested(kscope::StopReason reason);

private:
    StopReason evaluateStop(const SessionView& view, qint64 nowMs) const;

    Settings settings_;
    SessionState* session_ = nullptr;
    SessionLog* log_ = nullptr;
    const RecordBuilder* records_ = nullptr;
    const Clock* clock_ = nullptr;
    QTimer timer_;
    State state_ = State::Idle;
    int tickCount_ = 0;
};

}  // namespace kscope
