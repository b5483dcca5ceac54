#pragma once

#include <QHash>
#include <QQueue>
#include <QString>
#include <QVector>

namespace kscope {

struct ActorCount {
    QString actor;
    qint64 count = 0;

    bool operator==(const ActorCount& other) const {
        return actor == other.actor && count == other.count;
    }
};

struct WindowStats {
    int perSecond = 0;
    int perMinute = 0;
    int uniquePerSecond = 0;
    int uniquePerMinute = 0;
    qint64 total = 0;
    qint64 uniqueTotal = 0;
    QVector<ActorCount> topActors;

    bool operator==(const WindowStats& other) const {
        return perSecond == other.perSecond
            && perMinute == other.perMinute
            && uniquePerSecond == other.uniquePerSecond
            && uniquePerMinute == other.uniquePerMinute
            && total == other.total
            && uniqueTotal == other.uniqueTotal
            && topActors == other.topActors;
    }
};

// Rolling chat statistics. Events are kept in arrival order and evicted from
// the front once they fall behind the 60 s horizon. Lifetime counters are
// never evicted.
//
// Not synchronized; SessionState owns the lock.
class WindowAggregator {
public:
    static constexpr qint64 kHorizonMs = 60 * 1000;
    static constexpr qint64 kSecondMs = 1000;
    static constexpr int kTopActors = 3;

    void record(const QString& actor, qint64 occurredAtMs);
    WindowStats query(qint64 nowMs);

    [[nodiscard]] int retainedCount() const { return events_.size(); }
    [[nodiscard]] qint64 total() const { return total_; }
    [[nodiscard]] qint64 uniqueTotal() const { return firstSeen_.size(); }

private:
    struct Event {
        qint64 occurredAtMs = 0;
        QString actor;
    };

    void evictBefore(qint64 cutoffMs);
    QVector<ActorCount> topActors(int limit) const;

    QQueue<Event> events_;
    qint64 total_ = 0;
    QHash<QString, qint64> lifetimeCounts_;
    QHash<QString, int> firstSeen_;
};

}  // namespace kscope
