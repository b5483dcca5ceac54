#include "kscope/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

namespace kscope {

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    const qint64 prev = static_cast<qint64>(counters_.value(key).toDouble(0));
    counters_.insert(key, static_cast<double>(prev + delta));
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    const QJsonObject old = durations_.value(key).toObject();
    const qint64 count = static_cast<qint64>(old.value("count").toDouble(0)) + 1;
    const qint64 total = static_cast<qint64>(old.value("total_ms").toDouble(0)) + durationMs;
    const qint64 max = qMax(static_cast<qint64>(old.value("max_ms").toDouble(0)), durationMs);
    QJsonObject obj;
    obj.insert("count", static_cast<double>(count));
    obj.insert("total_ms", static_cast<double>(total));
    obj.insert("max_ms", static_cast<double>(max));
    obj.insert("avg_ms", static_cast<double>(total) / static_cast<double>(count));
    durations_.insert(key, obj);
}

void Telemetry::trimEventsLocked() {
    while (events_.size() > maxEvents_) {
        events_.removeFirst();
    }
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    events_.append(row);
    trimEventsLocked();
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return static_cast<qint64>(counters_.value(key).toDouble(0));
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject out;
    out.insert("counters", counters_);
    out.insert("gauges", gauges_);
    out.insert("durations", durations_);
    out.insert("events", events_);
    out.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    return out;
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QJsonObject payload = snapshot();

    QFile file(filePath);
    QDir dir = QFileInfo(file).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }

    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", "Failed to open telemetry export path."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(payload).toJson(QJsonDocument::Indented));
    file.close();
    return {
        {"success", true},
        {"path", filePath},
    };
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    counters_ = QJsonObject{};
    gauges_ = QJsonObject{};
    durations_ = QJsonObject{};
    events_ = QJsonArray{};
}

}  // namespace kscope
