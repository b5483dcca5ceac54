#include "test_support.hpp"

#include <QTemporaryDir>

#include "kscope/record_builder.hpp"
#include "kscope/session_log.hpp"

using namespace kscope;

TEST_CASE("Session log writes one flushed record per line", "[log]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("nested/session.jsonl");

    SessionLog log;
    const QJsonObject opened = log.open(path);
    REQUIRE(opened.value("success").toBool());
    REQUIRE(log.isOpen());

    RecordBuilder records("xqc", false);
    REQUIRE(log.append(records.sessionStart(668, 0)));
    REQUIRE(log.append(records.message("kim", "hello, world", 1'500)));

    // Visible to readers before the log is closed.
    const QVector<QJsonObject> lines = test::readRecords(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].value("type").toString() == "session_start");
    REQUIRE(lines[0].value("chatroom_id").toInteger() == 668);
    REQUIRE(lines[0].value("ts").toString() == "1970-01-01T00:00:00.000Z");
    REQUIRE(lines[1].value("type").toString() == "message");
    REQUIRE(lines[1].value("username").toString() == "kim");
    REQUIRE(lines[1].value("message").toString() == "hello, world");
    REQUIRE(lines[1].value("ts").toString() == "1970-01-01T00:00:01.500Z");
    REQUIRE(log.recordCount() == 2);

    log.close();
    REQUIRE_FALSE(log.isOpen());
    REQUIRE_FALSE(log.append(records.message("late", "", 2'000)));
    REQUIRE(test::readLines(path).size() == 2);
}

TEST_CASE("Opening truncates an existing log", "[log]") {
    QTemporaryDir dir;
    const QString path = dir.filePath("session.jsonl");
    {
        SessionLog log;
        REQUIRE(log.open(path).value("success").toBool());
        log.append({{"type", "message"}});
        log.append({{"type", "message"}});
    }
    SessionLog log;
    REQUIRE(log.open(path).value("success").toBool());
    log.append({{"type", "snapshot"}});
    log.close();
    REQUIRE(test::readLines(path) == QStringList{R"({"type":"snapshot"})"});
}

TEST_CASE("Open failure is reported, not thrown", "[log]") {
    QTemporaryDir dir;
    QFile blocker(dir.filePath("blocker"));
    REQUIRE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    SessionLog log;
    const QJsonObject result = log.open(dir.filePath("blocker/session.jsonl"));
    REQUIRE_FALSE(result.value("success").toBool());
    REQUIRE(result.value("error").toString().startsWith("Failed to open session log"));
    REQUIRE_FALSE(log.isOpen());
}

TEST_CASE("Snapshot records carry raw numbers and nullable fields", "[log][records]") {
    SessionView view;
    view.stats.perSecond = 3;
    view.stats.perMinute = 50;
    view.stats.uniquePerSecond = 2;
    view.stats.uniquePerMinute = 20;
    view.stats.total = 900;
    view.stats.uniqueTotal = 70;

    SECTION("unknown viewers and no capture") {
        const QJsonObject record = RecordBuilder("xqc", false).snapshot(view, 0);
        REQUIRE(record.value("type").toString() == "snapshot");
        REQUIRE(record.value("channel").toString() == "xqc");
        REQUIRE(record.value("messages_per_second").toInt() == 3);
        REQUIRE(record.value("messages_per_minute").toInt() == 50);
        REQUIRE(record.value("unique_per_second").toInt() == 2);
        REQUIRE(record.value("unique_per_minute").toInt() == 20);
        REQUIRE(record.value("total_messages").toInteger() == 900);
        REQUIRE(record.value("unique_total").toInteger() == 70);
        REQUIRE(record.value("viewer_count").isNull());
        REQUIRE(record.value("screenshot_path").isNull());
        REQUIRE(record.value("screenshot_base64").isNull());
    }

    SECTION("thumbnail only appears when embedding is enabled") {
        view.viewerCount = 12000;
        view.latestCapture = CaptureReference{"shots/xqc-1.jpg", 5};
        view.thumbnailBase64 = "QUJD";

        const QJsonObject plain = RecordBuilder("xqc", false).snapshot(view, 0);
        REQUIRE(plain.value("viewer_count").toInteger() == 12000);
        REQUIRE(plain.value("screenshot_path").toString() == "shots/xqc-1.jpg");
        REQUIRE(plain.value("screenshot_base64").isNull());

        const QJsonObject embedded = RecordBuilder("xqc", true).snapshot(view, 0);
        REQUIRE(embedded.value("screenshot_base64").toString() == "QUJD");
    }
}
