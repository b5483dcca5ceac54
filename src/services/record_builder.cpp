#include "kscope/record_builder.hpp"

#include <QDateTime>
#include <QJsonValue>

namespace kscope {

RecordBuilder::RecordBuilder(const QString& channelTag, bool embedThumbnail)
    : channelTag_(channelTag),
      embedThumbnail_(embedThumbnail) {}

QString RecordBuilder::isoTimestamp(qint64 epochMs) {
    return QDateTime::fromMSecsSinceEpoch(epochMs).toUTC().toString(Qt::ISODateWithMs);
}

QJsonObject RecordBuilder::base(const QString& type, qint64 atMs) const {
    QJsonObject record;
    record.insert("type", type);
    record.insert("ts", isoTimestamp(atMs));
    record.insert("channel", channelTag_);
    return record;
}

QJsonObject RecordBuilder::sessionStart(qint64 chatroomId, qint64 atMs) const {
    QJsonObject record = base("session_start", atMs);
    record.insert("chatroom_id", static_cast<double>(chatroomId));
    return record;
}

QJsonObject RecordBuilder::message(
    const QString& username,
    const QString& content,
    qint64 atMs) const {
    QJsonObject record = base("message", atMs);
    record.insert("username", username);
    record.insert("message", content);
    return record;
}

QJsonObject RecordBuilder::snapshot(const SessionView& view, qint64 atMs) const {
    QJsonObject record = base("snapshot", atMs);
    record.insert("messages_per_minute", view.stats.perMinute);
    record.insert("messages_per_second", view.stats.perSecond);
    record.insert("unique_per_minute", view.stats.uniquePerMinute);
    record.insert("unique_per_second", view.stats.uniquePerSecond);
    record.insert("total_messages", static_cast<double>(view.stats.total));
    record.insert("unique_total", static_cast<double>(view.stats.uniqueTotal));
    record.insert(
        "viewer_count",
        view.viewerCount ? QJsonValue(static_cast<double>(*view.viewerCount)) : QJsonValue());
    record.insert(
        "screenshot_path",
        view.latestCapture ? QJsonValue(view.latestCapture->path) : QJsonValue());
    record.insert(
        "screenshot_base64",
        embedThumbnail_ && !view.thumbnailBase64.isEmpty()
            ? QJsonValue(view.thumbnailBase64)
            : QJsonValue());
    return record;
}

}  // namespace kscope
