#pragma once

#include <QJsonObject>
#include <QString>

#include "kscope/session_state.hpp"

namespace kscope {

// Builds the three session log record types. Every record carries "type",
// a UTC "ts" with millisecond precision and the originating "channel".
class RecordBuilder {
public:
    RecordBuilder(const QString& channelTag, bool embedThumbnail);

    QJsonObject sessionStart(qint64 chatroomId, qint64 atMs) const;
    QJsonObject message(const QString& username, const QString& content, qint64 atMs) const;
    QJsonObject snapshot(const SessionView& view, qint64 atMs) const;

    static QString isoTimestamp(qint64 epochMs);

private:
    QJsonObject base(const QString& type, qint64 atMs) const;

    QString channelTag_;
    bool embedThumbnail_ = false;
};

}  // namespace kscope
