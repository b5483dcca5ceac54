#include "kscope/session_log.hpp"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

#include "kscope/telemetry.hpp"

namespace kscope {

SessionLog::~SessionLog() {
    close();
}

QJsonObject SessionLog::open(const QString& path) {
    QMutexLocker lock(&mutex_);
    if (file_.isOpen()) {
        file_.close();
    }

    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }

    file_.setFileName(path);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", QString("Failed to open session log: %1").arg(file_.errorString())},
            {"path", path},
        };
    }
    recordCount_ = 0;
    return {
        {"success", true},
        {"path", path},
    };
}

bool SessionLog::append(const QJsonObject& record) {
    QMutexLocker lock(&mutex_);
    if (!file_.isOpen()) {
        return false;
    }
    QByteArray line = QJsonDocument(record).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (file_.write(line) != line.size() || !file_.flush()) {
        Telemetry::instance().incrementCounter("log.write_failures");
        return false;
    }
    recordCount_++;
    return true;
}

void SessionLog::close() {
    QMutexLocker lock(&mutex_);
    if (file_.isOpen()) {
        file_.flush();
        file_.close();
    }
}

bool SessionLog::isOpen() const {
    QMutexLocker lock(&mutex_);
    return file_.isOpen();
}

QString SessionLog::path() const {
    QMutexLocker lock(&mutex_);
    return file_.fileName();
}

qint64 SessionLog::recordCount() const {
    QMutexLocker lock(&mutex_);
    return recordCount_;
}

}  // namespace kscope
