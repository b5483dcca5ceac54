#include "kscope/clock.hpp"

#include <QDateTime>

namespace kscope {

const SystemClock& SystemClock::instance() {
    static const SystemClock clock;
    return clock;
}

qint64 SystemClock::nowMs() const {
    return QDateTime::currentMSecsSinceEpoch();
}

QString utcFileStamp(qint64 epochMs) {
    return QDateTime::fromMSecsSinceEpoch(epochMs).toUTC().toString("yyyyMMdd-HHmmss");
}

}  // namespace kscope
