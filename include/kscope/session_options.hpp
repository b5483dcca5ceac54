#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

class QCommandLineParser;

namespace kscope {

// Everything a run needs, validated once before any activity starts.
struct SessionOptions {
    // Longest duration, interval or inactivity a millisecond timer can hold.
    static constexpr int kMaxTimerSec = 2147483;

    QString channel;
    std::optional<qint64> chatroomId;
    QString proxy;
    QString logPath;
    std::optional<int> durationSec;
    std::optional<int> inactivitySec;
    std::optional<int> screenshotIntervalSec;
    bool screenshotOnSnapshot = false;
    QString screenshotDir;
    std::optional<int> screenshotMax;
    QString screenshotFormat = "jpg";
    bool screenshotEmbed = false;
    int screenshotEmbedWidth = 160;
    QString streamUrl;
    QString ffmpegPath;
    QString feedUrl;

    [[nodiscard]] bool capturesEnabled() const {
        return screenshotOnSnapshot || screenshotIntervalSec.has_value();
    }
    // Channel name, or "chatroom-<id>" when only an id was given.
    [[nodiscard]] QString sessionLabel() const;
    // Value of the "channel" field in log records.
    [[nodiscard]] QString channelTag() const;

    // Empty when the combination is valid, otherwise a one-line reason.
    [[nodiscard]] QString validate() const;

    QString applyJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;
};

QString defaultLogPath(const QString& label, qint64 startMs);
QString defaultCaptureDir(const QString& logPath);

QJsonObject loadOptionsFile(const QString& path, SessionOptions* options);

void addRunOptions(QCommandLineParser& parser);
QString applyCommandLine(const QCommandLineParser& parser, SessionOptions* options);

}  // namespace kscope
