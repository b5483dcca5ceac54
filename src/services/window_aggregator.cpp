#include "kscope/window_aggregator.hpp"

#include <QSet>

#include <algorithm>

namespace kscope {

void WindowAggregator::record(const QString& actor, qint64 occurredAtMs) {
    events_.enqueue({occurredAtMs, actor});
    total_++;
    lifetimeCounts_[actor] += 1;
    if (!firstSeen_.contains(actor)) {
        firstSeen_.insert(actor, firstSeen_.size());
    }
}

void WindowAggregator::evictBefore(qint64 cutoffMs) {
    while (!events_.isEmpty() && events_.head().occurredAtMs < cutoffMs) {
        events_.dequeue();
    }
}

WindowStats WindowAggregator::query(qint64 nowMs) {
    evictBefore(nowMs - kHorizonMs);

    // The per-second figures are a rescan of the retained minute. That stays
    // cheap only while chat rates are modest.
    QSet<QString> minuteActors;
    QSet<QString> secondActors;
    int perSecond = 0;
    for (const Event& event : events_) {
        minuteActors.insert(event.actor);
        const qint64 ageMs = qMax<qint64>(0, nowMs - event.occurredAtMs);
        if (ageMs <= kSecondMs) {
            perSecond++;
            secondActors.insert(event.actor);
        }
    }

    WindowStats stats;
    stats.perSecond = perSecond;
    stats.perMinute = events_.size();
    stats.uniquePerSecond = secondActors.size();
    stats.uniquePerMinute = minuteActors.size();
    stats.total = total_;
    stats.uniqueTotal = firstSeen_.size();
    stats.topActors = topActors(kTopActors);
    return stats;
}

QVector<ActorCount> WindowAggregator::topActors(int limit) const {
    QVector<ActorCount> ranked;
    ranked.reserve(lifetimeCounts_.size());
    for (auto it = lifetimeCounts_.constBegin(); it != lifetimeCounts_.constEnd(); ++it) {
        ranked.append({it.key(), it.value()});
    }
    std::sort(ranked.begin(), ranked.end(), [this](const ActorCount& a, const ActorCount& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return firstSeen_.value(a.actor) < firstSeen_.value(b.actor);
    });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

}  // namespace kscope
