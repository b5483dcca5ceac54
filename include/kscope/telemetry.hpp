#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace kscope {

// Process-wide diagnostics sink: counters, gauges, durations and a bounded
// ring of recent events. Exported as JSON when the process exits.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;
    void reset();

private:
    Telemetry() = default;

    void trimEventsLocked();

    mutable QMutex mutex_;
    QJsonObject counters_;
    QJsonObject gauges_;
    QJsonObject durations_;
    QJsonArray events_;

    int maxEvents_ = 1500;
};

}  // namespace kscope
