#include "kscope/session_export.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QStringList>
#include <QVector>

namespace kscope {

namespace {

QJsonObject readRecords(const QString& inputPath, const QString& type, QVector<QJsonObject>* out) {
    QFile file(inputPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", QString("Failed to open session log: %1").arg(file.errorString())},
            {"path", inputPath},
        };
    }
    int skipped = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const QJsonDocument doc = QJsonDocument::fromJson(line);
        if (!doc.isObject()) {
            skipped++;
            continue;
        }
        const QJsonObject record = doc.object();
        if (record.value("type").toString() == type) {
            out->append(record);
        }
    }
    return {
        {"success", true},
        {"skipped_lines", skipped},
    };
}

QString cell(const QJsonValue& value) {
    if (value.isNull() || value.isUndefined()) {
        return {};
    }
    if (value.isString()) {
        return value.toString();
    }
    if (value.isBool()) {
        return value.toBool() ? "true" : "false";
    }
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (number == static_cast<double>(value.toInteger())) {
            return QString::number(value.toInteger());
        }
        return QString::number(number);
    }
    return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
}

QJsonObject writeCsv(
    const QString& outputPath,
    const QStringList& header,
    const QVector<QStringList>& rows) {
    const QFileInfo info(outputPath);
    if (!info.absoluteDir().exists()) {
        info.absoluteDir().mkpath(".");
    }
    QFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", QString("Failed to write %1: %2").arg(outputPath, file.errorString())},
            {"path", outputPath},
        };
    }
    QByteArray payload("\xEF\xBB\xBF");
    payload.append(header.join(',').toUtf8());
    payload.append('\n');
    for (const QStringList& row : rows) {
        QStringList escaped;
        escaped.reserve(row.size());
        for (const QString& value : row) {
            escaped.append(csvEscape(value));
        }
        payload.append(escaped.join(',').toUtf8());
        payload.append('\n');
    }
    if (file.write(payload) != payload.size()) {
        return {
            {"success", false},
            {"error", QString("Failed to write %1: %2").arg(outputPath, file.errorString())},
            {"path", outputPath},
        };
    }
    file.close();
    return {
        {"success", true},
        {"path", outputPath},
        {"rows", static_cast<int>(rows.size())},
    };
}

}  // namespace

QString csvEscape(const QString& value) {
    if (value.contains('"') || value.contains(',') || value.contains('\n') || value.contains('\r')) {
        QString quoted = value;
        quoted.replace("\"", "\"\"");
        return "\"" + quoted + "\"";
    }
    return value;
}

QString defaultSnapshotsCsvPath(const QString& inputPath) {
    const QFileInfo info(inputPath);
    const QString suffix = info.suffix();
    if (suffix.isEmpty()) {
        return inputPath + ".csv";
    }
    return inputPath.left(inputPath.size() - suffix.size()) + "csv";
}

QString defaultMessagesCsvPath(const QString& inputPath) {
    const QFileInfo info(inputPath);
    return info.dir().filePath(info.completeBaseName() + "-messages.csv");
}

QJsonObject exportSnapshotsCsv(const QString& inputPath, const QString& outputPath) {
    QVector<QJsonObject> records;
    const QJsonObject read = readRecords(inputPath, "snapshot", &records);
    if (!read.value("success").toBool(false)) {
        return read;
    }
    if (records.isEmpty()) {
        return {
            {"success", false},
            {"error", "No snapshot data found"},
            {"path", inputPath},
        };
    }

    const QStringList header = {
        "timestamp",
        "channel",
        "messages_per_minute",
        "messages_per_second",
        "unique_per_minute",
        "unique_per_second",
        "total_messages",
        "unique_total",
        "viewer_count",
        "screenshot_path",
    };
    QVector<QStringList> rows;
    rows.reserve(records.size());
    for (const QJsonObject& record : records) {
        rows.append({
            cell(record.value("ts")),
            cell(record.value("channel")),
            cell(record.value("messages_per_minute")),
            cell(record.value("messages_per_second")),
            cell(record.value("unique_per_minute")),
            cell(record.value("unique_per_second")),
            cell(record.value("total_messages")),
            cell(record.value("unique_total")),
            cell(record.value("viewer_count")),
            cell(record.value("screenshot_path")),
        });
    }
    return writeCsv(outputPath.isEmpty() ? defaultSnapshotsCsvPath(inputPath) : outputPath, header, rows);
}

QJsonObject exportMessagesCsv(const QString& inputPath, const QString& outputPath) {
    QVector<QJsonObject> records;
    const QJsonObject read = readRecords(inputPath, "message", &records);
    if (!read.value("success").toBool(false)) {
        return read;
    }
    if (records.isEmpty()) {
        return {
            {"success", false},
            {"error", "No message data found"},
            {"path", inputPath},
        };
    }

    const QStringList header = {"timestamp", "channel", "username", "message"};
    QVector<QStringList> rows;
    rows.reserve(records.size());
    for (const QJsonObject& record : records) {
        rows.append({
            cell(record.value("ts")),
            cell(record.value("channel")),
            cell(record.value("username")),
            cell(record.value("message")),
        });
    }
    return writeCsv(outputPath.isEmpty() ? defaultMessagesCsvPath(inputPath) : outputPath, header, rows);
}

}  // namespace kscope
