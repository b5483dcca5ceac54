#include "kscope/session_options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>

#include "kscope/clock.hpp"

namespace kscope {

namespace {

QString readJsonInt(const QJsonObject& object, const QString& key, std::optional<int>* out) {
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return {};
    }
    if (!value.isDouble() || value.toDouble() != static_cast<double>(value.toInt())) {
        return QString("Config key '%1' must be an integer.").arg(key);
    }
    *out = value.toInt();
    return {};
}

QString readJsonString(const QJsonObject& object, const QString& key, QString* out) {
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return {};
    }
    if (!value.isString()) {
        return QString("Config key '%1' must be a string.").arg(key);
    }
    *out = value.toString();
    return {};
}

QString readJsonBool(const QJsonObject& object, const QString& key, bool* out) {
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return {};
    }
    if (!value.isBool()) {
        return QString("Config key '%1' must be true or false.").arg(key);
    }
    *out = value.toBool();
    return {};
}

QString readCliInt(const QCommandLineParser& parser, const QString& name, std::optional<int>* out) {
    if (!parser.isSet(name)) {
        return {};
    }
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    if (!ok) {
        return QString("--%1 expects an integer.").arg(name);
    }
    *out = value;
    return {};
}

}  // namespace

QString SessionOptions::sessionLabel() const {
    if (!channel.isEmpty()) {
        return channel;
    }
    return QString("chatroom-%1").arg(chatroomId.value_or(0));
}

QString SessionOptions::channelTag() const {
    return channel.isEmpty() ? QString("manual") : channel;
}

QString SessionOptions::validate() const {
    if (channel.isEmpty() && !chatroomId) {
        return "Provide --channel or --chatroom-id";
    }
    if (chatroomId && *chatroomId <= 0) {
        return "Chatroom id must be a positive number.";
    }
    if (screenshotOnSnapshot && screenshotIntervalSec) {
        return "Use either --screenshot-interval or --screenshot-on-snapshot, not both.";
    }
    if (screenshotFormat != "jpg" && screenshotFormat != "png") {
        return "Screenshot format must be jpg or png.";
    }
    if (screenshotMax && *screenshotMax <= 0) {
        return "Screenshot max must be a positive number.";
    }
    if (screenshotEmbedWidth <= 0) {
        return "Screenshot embed width must be a positive number.";
    }
    if (screenshotIntervalSec && *screenshotIntervalSec <= 0) {
        return "Screenshot interval must be a positive number of seconds.";
    }
    if (screenshotIntervalSec && *screenshotIntervalSec > kMaxTimerSec) {
        return QString("Screenshot interval must be at most %1 seconds.").arg(kMaxTimerSec);
    }
    if (durationSec && *durationSec <= 0) {
        return "Duration must be a positive number of seconds.";
    }
    if (durationSec && *durationSec > kMaxTimerSec) {
        return QString("Duration must be at most %1 seconds.").arg(kMaxTimerSec);
    }
    if (inactivitySec && *inactivitySec <= 0) {
        return "Inactivity must be a positive number of seconds.";
    }
    if (inactivitySec && *inactivitySec > kMaxTimerSec) {
        return QString("Inactivity must be at most %1 seconds.").arg(kMaxTimerSec);
    }
    return {};
}

QString SessionOptions::applyJson(const QJsonObject& object) {
    QString error;
    if (!(error = readJsonString(object, "channel", &channel)).isEmpty()) {
        return error;
    }
    const QJsonValue room = object.value("chatroom_id");
    if (room.isString()) {
        bool ok = false;
        const qint64 id = room.toString().toLongLong(&ok);
        if (!ok) {
            return "Config key 'chatroom_id' must be a number.";
        }
        chatroomId = id;
    } else if (room.isDouble()) {
        chatroomId = room.toInteger();
    } else if (!room.isUndefined() && !room.isNull()) {
        return "Config key 'chatroom_id' must be a number.";
    }

    const QList<QPair<QString, std::optional<int>*>> ints = {
        {"duration", &durationSec},
        {"inactivity", &inactivitySec},
        {"screenshot_interval", &screenshotIntervalSec},
        {"screenshot_max", &screenshotMax},
    };
    for (const auto& entry : ints) {
        if (!(error = readJsonInt(object, entry.first, entry.second)).isEmpty()) {
            return error;
        }
    }
    std::optional<int> embedWidth;
    if (!(error = readJsonInt(object, "screenshot_embed_width", &embedWidth)).isEmpty()) {
        return error;
    }
    if (embedWidth) {
        screenshotEmbedWidth = *embedWidth;
    }

    const QList<QPair<QString, QString*>> strings = {
        {"proxy", &proxy},
        {"log", &logPath},
        {"screenshot_dir", &screenshotDir},
        {"screenshot_format", &screenshotFormat},
        {"stream_url", &streamUrl},
        {"ffmpeg_path", &ffmpegPath},
        {"feed_url", &feedUrl},
    };
    for (const auto& entry : strings) {
        if (!(error = readJsonString(object, entry.first, entry.second)).isEmpty()) {
            return error;
        }
    }
    if (!(error = readJsonBool(object, "screenshot_on_snapshot", &screenshotOnSnapshot)).isEmpty()) {
        return error;
    }
    if (!(error = readJsonBool(object, "screenshot_embed", &screenshotEmbed)).isEmpty()) {
        return error;
    }

    channel = channel.trimmed().toLower();
    screenshotFormat = screenshotFormat.trimmed().toLower();
    return {};
}

QJsonObject SessionOptions::toJson() const {
    QJsonObject out;
    out.insert("channel", channel);
    out.insert("chatroom_id", chatroomId ? QJsonValue(static_cast<double>(*chatroomId)) : QJsonValue());
    out.insert("log", logPath);
    out.insert("duration", durationSec ? QJsonValue(*durationSec) : QJsonValue());
    out.insert("inactivity", inactivitySec ? QJsonValue(*inactivitySec) : QJsonValue());
    out.insert(
        "screenshot_interval",
        screenshotIntervalSec ? QJsonValue(*screenshotIntervalSec) : QJsonValue());
    out.insert("screenshot_on_snapshot", screenshotOnSnapshot);
    out.insert("screenshot_dir", screenshotDir);
    out.insert("screenshot_max", screenshotMax ? QJsonValue(*screenshotMax) : QJsonValue());
    out.insert("screenshot_format", screenshotFormat);
    out.insert("screenshot_embed", screenshotEmbed);
    out.insert("screenshot_embed_width", screenshotEmbedWidth);
    return out;
}

QString defaultLogPath(const QString& label, qint64 startMs) {
    return QString("kick-session-%1-%2.jsonl").arg(label, utcFileStamp(startMs));
}

QString defaultCaptureDir(const QString& logPath) {
    const QFileInfo info(logPath);
    return info.dir().filePath(info.completeBaseName() + "-screenshots");
}

QJsonObject loadOptionsFile(const QString& path, SessionOptions* options) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open config file."},
            {"path", path},
        };
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (!doc.isObject()) {
        return {
            {"success", false},
            {"error", parseError.error != QJsonParseError::NoError
                    ? QString("Config file is not valid JSON: %1").arg(parseError.errorString())
                    : QString("Config file must contain a JSON object.")},
            {"path", path},
        };
    }
    const QString error = options->applyJson(doc.object());
    if (!error.isEmpty()) {
        return {
            {"success", false},
            {"error", error},
            {"path", path},
        };
    }
    return {
        {"success", true},
        {"path", path},
    };
}

void addRunOptions(QCommandLineParser& parser) {
    parser.addOptions({
        {"channel", "Kick channel name.", "name"},
        {"chatroom-id", "Chatroom id (skips channel resolution).", "id"},
        {"proxy", "Proxy base url, e.g. http://localhost:3456.", "url"},
        {"log", "Path to the session log (JSONL).", "path"},
        {"duration", "Stop after N seconds.", "seconds"},
        {"inactivity", "Stop after N seconds without messages.", "seconds"},
        {"screenshot-interval", "Capture a 480p screenshot every N seconds.", "seconds"},
        {"screenshot-on-snapshot", "Capture a screenshot on each snapshot tick."},
        {"screenshot-dir", "Directory to write screenshots.", "path"},
        {"screenshot-max", "Max screenshots to keep (older files are deleted).", "count"},
        {"screenshot-format", "Screenshot file format: jpg or png.", "format", "jpg"},
        {"screenshot-embed", "Embed a base64 thumbnail in JSON snapshots."},
        {"screenshot-embed-width", "Thumbnail width when embedding base64.", "pixels", "160"},
        {"stream-url", "Explicit stream URL (m3u8) for screenshots.", "url"},
        {"ffmpeg-path", "Explicit path to the ffmpeg executable.", "path"},
        {"feed-url", "Override the real-time feed endpoint.", "url"},
        {"config", "JSON file with default run options.", "path"},
    });
}

QString applyCommandLine(const QCommandLineParser& parser, SessionOptions* options) {
    if (parser.isSet("config")) {
        const QJsonObject loaded = loadOptionsFile(parser.value("config"), options);
        if (!loaded.value("success").toBool(false)) {
            return loaded.value("error").toString();
        }
    }

    if (parser.isSet("channel")) {
        options->channel = parser.value("channel").trimmed().toLower();
    }
    if (parser.isSet("chatroom-id")) {
        bool ok = false;
        const qint64 id = parser.value("chatroom-id").toLongLong(&ok);
        if (!ok) {
            return "--chatroom-id expects a number.";
        }
        options->chatroomId = id;
    }

    QString error;
    if (!(error = readCliInt(parser, "duration", &options->durationSec)).isEmpty()
        || !(error = readCliInt(parser, "inactivity", &options->inactivitySec)).isEmpty()
        || !(error = readCliInt(parser, "screenshot-interval", &options->screenshotIntervalSec)).isEmpty()
        || !(error = readCliInt(parser, "screenshot-max", &options->screenshotMax)).isEmpty()) {
        return error;
    }
    if (parser.isSet("screenshot-embed-width")) {
        std::optional<int> width;
        if (!(error = readCliInt(parser, "screenshot-embed-width", &width)).isEmpty()) {
            return error;
        }
        options->screenshotEmbedWidth = *width;
    }

    if (parser.isSet("proxy")) {
        options->proxy = parser.value("proxy");
    }
    if (parser.isSet("log")) {
        options->logPath = parser.value("log");
    }
    if (parser.isSet("screenshot-dir")) {
        options->screenshotDir = parser.value("screenshot-dir");
    }
    if (parser.isSet("screenshot-format")) {
        options->screenshotFormat = parser.value("screenshot-format").trimmed().toLower();
    }
    if (parser.isSet("stream-url")) {
        options->streamUrl = parser.value("stream-url");
    }
    if (parser.isSet("ffmpeg-path")) {
        options->ffmpegPath = parser.value("ffmpeg-path");
    }
    if (parser.isSet("feed-url")) {
        options->feedUrl = parser.value("feed-url");
    }
    if (parser.isSet("screenshot-on-snapshot")) {
        options->screenshotOnSnapshot = true;
    }
    if (parser.isSet("screenshot-embed")) {
        options->screenshotEmbed = true;
    }
    return {};
}

}  // namespace kscope
