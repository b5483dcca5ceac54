#pragma once

#include <QString>

#include <optional>

#include "kscope/session_state.hpp"

namespace kscope {

QString formatCount(std::optional<qint64> value);
QString formatTopActors(const QVector<ActorCount>& actors);
QString padField(const QString& text, int width);

// One-line operator view of a snapshot. ANSI colours only when useColor.
QString renderStatusLine(const SessionView& view, bool useColor);

}  // namespace kscope
