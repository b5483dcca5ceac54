#include "test_support.hpp"

#include <QJsonArray>
#include <QTemporaryDir>

#include "kscope/telemetry.hpp"

using kscope::Telemetry;

TEST_CASE("Telemetry accumulates counters, gauges and durations", "[telemetry]") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.reset();

    telemetry.incrementCounter("feed.frames");
    telemetry.incrementCounter("feed.frames", 4);
    telemetry.setGauge("viewers.last_count", 1200);
    telemetry.recordDurationMs("scheduler.tick_ms", 2);
    telemetry.recordDurationMs("scheduler.tick_ms", 6);

    REQUIRE(telemetry.counter("feed.frames") == 5);
    REQUIRE(telemetry.counter("never.touched") == 0);

    const QJsonObject snapshot = telemetry.snapshot();
    REQUIRE(snapshot.value("gauges").toObject().value("viewers.last_count").toDouble() == 1200.0);
    const QJsonObject tick = snapshot.value("durations").toObject().value("scheduler.tick_ms").toObject();
    REQUIRE(tick.value("count").toInt() == 2);
    REQUIRE(tick.value("max_ms").toInt() == 6);
    REQUIRE(tick.value("avg_ms").toDouble() == 4.0);

    telemetry.reset();
    REQUIRE(telemetry.counter("feed.frames") == 0);
}

TEST_CASE("Telemetry keeps a bounded event history", "[telemetry]") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.reset();
    for (int i = 0; i < 1600; ++i) {
        telemetry.recordEvent("feed_disconnected", {{"attempt", i}});
    }
    const QJsonArray events = telemetry.snapshot().value("events").toArray();
    REQUIRE(events.size() == 1500);
    REQUIRE(events.first().toObject().value("attempt").toInt() == 100);
    REQUIRE(events.last().toObject().value("type").toString() == "feed_disconnected");
    telemetry.reset();
}

TEST_CASE("Telemetry exports to a JSON file", "[telemetry]") {
    QTemporaryDir dir;
    Telemetry& telemetry = Telemetry::instance();
    telemetry.reset();
    telemetry.incrementCounter("capture.count", 3);

    const QString path = dir.filePath("logs/telemetry_last_exit.json");
    const QJsonObject result = telemetry.exportToFile(path);
    REQUIRE(result.value("success").toBool());

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    const QJsonObject exported = QJsonDocument::fromJson(file.readAll()).object();
    REQUIRE(exported.value("counters").toObject().value("capture.count").toInt() == 3);
    telemetry.reset();
}
