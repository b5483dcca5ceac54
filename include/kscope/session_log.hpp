#pragma once

#include <QFile>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace kscope {

// Append-only NDJSON writer. One record per line, flushed as soon as it is
// written; the file is truncated on open and never rewritten afterwards.
class SessionLog {
public:
    SessionLog() = default;
    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    QJsonObject open(const QString& path);
    bool append(const QJsonObject& record);
    void close();

    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] QString path() const;
    [[nodiscard]] qint64 recordCount() const;

private:
    mutable QMutex mutex_;
    QFile file_;
    qint64 recordCount_ = 0;
};

}  // namespace kscope
