#include "test_support.hpp"

#include <QTemporaryDir>

#include "kscope/session_export.hpp"

using namespace kscope;

namespace {

const QByteArray kBom("\xEF\xBB\xBF");

QString writeSessionLog(const QTemporaryDir& dir) {
    const QString path = dir.filePath("kick-session-xqc.jsonl");
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write(
        R"({"type":"session_start","ts":"2024-03-05T06:07:08.000Z","channel":"xqc","chatroom_id":668})" "\n"
        R"({"type":"message","ts":"2024-03-05T06:07:09.120Z","channel":"xqc","username":"kim","message":"gg, \"ez\""})" "\n"
        "this line is not json\n"
        "\n"
        R"({"type":"snapshot","ts":"2024-03-05T06:07:10.000Z","channel":"xqc","messages_per_minute":1,"messages_per_second":0,"unique_per_minute":1,"unique_per_second":0,"total_messages":1,"unique_total":1,"viewer_count":null,"screenshot_path":null,"screenshot_base64":null})" "\n"
        R"({"type":"snapshot","ts":"2024-03-05T06:07:11.000Z","channel":"xqc","messages_per_minute":1,"messages_per_second":0,"unique_per_minute":1,"unique_per_second":0,"total_messages":1,"unique_total":1,"viewer_count":51234,"screenshot_path":"shots/xqc-1.jpg","screenshot_base64":null})" "\n");
    file.close();
    return path;
}

QByteArray readAll(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

}  // namespace

TEST_CASE("Snapshot export writes one row per snapshot", "[export]") {
    QTemporaryDir dir;
    const QString input = writeSessionLog(dir);

    const QJsonObject result = exportSnapshotsCsv(input);
    REQUIRE(result.value("success").toBool());
    REQUIRE(result.value("path").toString() == dir.filePath("kick-session-xqc.csv"));
    REQUIRE(result.value("rows").toInt() == 2);

    const QByteArray csv = readAll(result.value("path").toString());
    REQUIRE(csv.startsWith(kBom));
    const QList<QByteArray> lines = csv.mid(kBom.size()).split('\n');
    REQUIRE(lines[0] == "timestamp,channel,messages_per_minute,messages_per_second,unique_per_minute,"
                        "unique_per_second,total_messages,unique_total,viewer_count,screenshot_path");
    REQUIRE(lines[1] == "2024-03-05T06:07:10.000Z,xqc,1,0,1,0,1,1,,");
    REQUIRE(lines[2] == "2024-03-05T06:07:11.000Z,xqc,1,0,1,0,1,1,51234,shots/xqc-1.jpg");
}

TEST_CASE("Message export quotes commas and quotes", "[export]") {
    QTemporaryDir dir;
    const QString input = writeSessionLog(dir);
    const QString output = dir.filePath("out/messages.csv");

    const QJsonObject result = exportMessagesCsv(input, output);
    REQUIRE(result.value("success").toBool());
    const QByteArray csv = readAll(output);
    REQUIRE(csv == kBom + "timestamp,channel,username,message\n"
                          "2024-03-05T06:07:09.120Z,xqc,kim,\"gg, \"\"ez\"\"\"\n");
}

TEST_CASE("Message export default path", "[export]") {
    REQUIRE(defaultMessagesCsvPath("logs/kick-session-xqc.jsonl") == "logs/kick-session-xqc-messages.csv");
    REQUIRE(defaultSnapshotsCsvPath("logs/kick-session-xqc.jsonl") == "logs/kick-session-xqc.csv");
    REQUIRE(defaultSnapshotsCsvPath("session") == "session.csv");
}

TEST_CASE("Exports report when there is nothing to write", "[export]") {
    QTemporaryDir dir;
    const QString input = dir.filePath("empty.jsonl");
    QFile file(input);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write(R"({"type":"session_start","ts":"x","channel":"manual","chatroom_id":1})" "\n");
    file.close();

    SECTION("snapshots") {
        const QJsonObject result = exportSnapshotsCsv(input);
        REQUIRE_FALSE(result.value("success").toBool());
        REQUIRE(result.value("error").toString() == "No snapshot data found");
        REQUIRE_FALSE(QFile::exists(dir.filePath("empty.csv")));
    }
    SECTION("messages") {
        const QJsonObject result = exportMessagesCsv(input);
        REQUIRE_FALSE(result.value("success").toBool());
        REQUIRE(result.value("error").toString() == "No message data found");
    }
    SECTION("missing input") {
        const QJsonObject result = exportMessagesCsv(dir.filePath("absent.jsonl"));
        REQUIRE_FALSE(result.value("success").toBool());
    }
}

TEST_CASE("CSV escaping", "[export]") {
    REQUIRE(csvEscape("plain") == "plain");
    REQUIRE(csvEscape("a,b") == "\"a,b\"");
    REQUIRE(csvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    REQUIRE(csvEscape("two\nlines") == "\"two\nlines\"");
}
