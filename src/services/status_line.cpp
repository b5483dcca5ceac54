#include "kscope/status_line.hpp"

#include <QLocale>
#include <QStringList>

namespace kscope {

namespace {

QString colorize(const QString& text, const char* code, bool enabled) {
    if (!enabled) {
        return text;
    }
    return QString("\x1b[%1m%2\x1b[0m").arg(QString::fromLatin1(code), text);
}

QString field(
    const QString& label,
    const char* labelCode,
    const QString& value,
    const char* valueCode,
    bool useColor) {
    return colorize(label, labelCode, useColor) + "=" + colorize(value, valueCode, useColor);
}

}  // namespace

QString formatCount(std::optional<qint64> value) {
    if (!value) {
        return "n/a";
    }
    return QLocale(QLocale::English).toString(*value);
}

QString formatTopActors(const QVector<ActorCount>& actors) {
    if (actors.isEmpty()) {
        return "n/a";
    }
    QStringList parts;
    for (const ActorCount& actor : actors) {
        parts.append(QString("%1(%2)").arg(actor.actor, QString::number(actor.count)));
    }
    return parts.join(", ");
}

QString padField(const QString& text, int width) {
    if (text.size() >= width) {
        return text.left(width);
    }
    return text.leftJustified(width, ' ');
}

QString renderStatusLine(const SessionView& view, bool useColor) {
    const WindowStats& s = view.stats;
    const QStringList fields = {
        field("viewers", "36", padField(formatCount(view.viewerCount), 9), "96", useColor),
        field("msg/s", "33", padField(QString::number(static_cast<double>(s.perSecond), 'f', 1), 6), "93", useColor),
        field("msg/min", "33", padField(QString::number(s.perMinute), 6), "93", useColor),
        field("uniq/s", "35", padField(QString::number(s.uniquePerSecond), 6), "95", useColor),
        field("uniq/min", "35", padField(QString::number(s.uniquePerMinute), 6), "95", useColor),
        field("total", "32", padField(QString::number(s.total), 9), "92", useColor),
        field("uniq_total", "32", padField(QString::number(s.uniqueTotal), 9), "92", useColor),
        field("top", "34", padField(formatTopActors(s.topActors), 32), "94", useColor),
    };
    return fields.join("  ");
}

}  // namespace kscope
