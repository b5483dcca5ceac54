#pragma once

#include <QJsonObject>
#include <QString>

namespace kscope {

// Offline conversions of a session log into spreadsheet-friendly CSV. Both
// write UTF-8 with a byte-order mark and skip lines that are not JSON.
QJsonObject exportSnapshotsCsv(const QString& inputPath, const QString& outputPath = {});
QJsonObject exportMessagesCsv(const QString& inputPath, const QString& outputPath = {});

QString csvEscape(const QString& value);
QString defaultSnapshotsCsvPath(const QString& inputPath);
QString defaultMessagesCsvPath(const QString& inputPath);

}  // namespace kscope
