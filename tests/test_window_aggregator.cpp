#include "test_support.hpp"

#include "kscope/window_aggregator.hpp"

using kscope::ActorCount;
using kscope::WindowAggregator;
using kscope::WindowStats;

TEST_CASE("Empty window reports zeros", "[aggregator]") {
    WindowAggregator aggregator;
    const WindowStats stats = aggregator.query(10'000);

    REQUIRE(stats.perSecond == 0);
    REQUIRE(stats.perMinute == 0);
    REQUIRE(stats.uniquePerSecond == 0);
    REQUIRE(stats.uniquePerMinute == 0);
    REQUIRE(stats.total == 0);
    REQUIRE(stats.uniqueTotal == 0);
    REQUIRE(stats.topActors.isEmpty());
}

TEST_CASE("Mixed actors inside one second", "[aggregator]") {
    WindowAggregator aggregator;
    aggregator.record("A", 10'000);
    aggregator.record("A", 10'200);
    aggregator.record("B", 10'400);
    aggregator.record("C", 10'600);

    const WindowStats stats = aggregator.query(10'900);
    REQUIRE(stats.perSecond == 4);
    REQUIRE(stats.perMinute == 4);
    REQUIRE(stats.uniquePerSecond == 3);
    REQUIRE(stats.uniquePerMinute == 3);
    REQUIRE(stats.total == 4);
    REQUIRE(stats.uniqueTotal == 3);

    const QVector<ActorCount> expected = {{"A", 2}, {"B", 1}, {"C", 1}};
    REQUIRE(stats.topActors == expected);
}

TEST_CASE("Top actors break ties by first appearance", "[aggregator]") {
    WindowAggregator aggregator;
    aggregator.record("zed", 0);
    aggregator.record("amy", 1);
    aggregator.record("bob", 2);
    aggregator.record("kim", 3);
    aggregator.record("bob", 4);

    const WindowStats stats = aggregator.query(5);
    const QVector<ActorCount> expected = {{"bob", 2}, {"zed", 1}, {"amy", 1}};
    REQUIRE(stats.topActors == expected);
}

TEST_CASE("Per-second counts only the trailing second", "[aggregator]") {
    WindowAggregator aggregator;
    aggregator.record("early", 1'000);
    aggregator.record("edge", 4'000);
    aggregator.record("late", 4'500);

    const WindowStats stats = aggregator.query(5'000);
    REQUIRE(stats.perSecond == 2);
    REQUIRE(stats.uniquePerSecond == 2);
    REQUIRE(stats.perMinute == 3);
}

TEST_CASE("Events older than the horizon are evicted", "[aggregator]") {
    WindowAggregator aggregator;
    aggregator.record("old", 0);
    aggregator.record("old", 30'000);
    aggregator.record("new", 61'000);

    SECTION("boundary event is retained") {
        const WindowStats stats = aggregator.query(60'000);
        REQUIRE(stats.perMinute == 3);
    }

    SECTION("front entries are dropped once past the horizon") {
        const WindowStats stats = aggregator.query(61'001);
        REQUIRE(stats.perMinute == 2);
        REQUIRE(aggregator.retainedCount() == 2);
        REQUIRE(stats.uniquePerMinute == 2);
    }

    SECTION("lifetime totals survive eviction") {
        const WindowStats stats = aggregator.query(200'000);
        REQUIRE(stats.perMinute == 0);
        REQUIRE(stats.total == 3);
        REQUIRE(stats.uniqueTotal == 2);
        const QVector<ActorCount> expected = {{"old", 2}, {"new", 1}};
        REQUIRE(stats.topActors == expected);
    }
}

TEST_CASE("Future timestamps are clamped to now", "[aggregator]") {
    WindowAggregator aggregator;
    aggregator.record("ahead", 12'000);

    const WindowStats stats = aggregator.query(10'000);
    REQUIRE(stats.perSecond == 1);
    REQUIRE(stats.perMinute == 1);
}

TEST_CASE("Repeated queries at the same instant agree", "[aggregator]") {
    WindowAggregator aggregator;
    for (int i = 0; i < 50; ++i) {
        aggregator.record(QString("user%1").arg(i % 7), i * 1'500);
    }
    const WindowStats first = aggregator.query(80'000);
    const WindowStats second = aggregator.query(80'000);
    REQUIRE(first == second);
}

TEST_CASE("Window invariants hold across a long stream", "[aggregator]") {
    WindowAggregator aggregator;
    qint64 now = 0;
    for (int i = 0; i < 400; ++i) {
        now += 250 + (i % 5) * 100;
        aggregator.record(QString("u%1").arg(i % 13), now);
        if (i % 9 == 0) {
            const WindowStats stats = aggregator.query(now);
            REQUIRE(stats.perSecond <= stats.perMinute);
            REQUIRE(stats.uniquePerSecond <= stats.uniquePerMinute);
            REQUIRE(stats.uniquePerMinute <= stats.perMinute);
            REQUIRE(stats.perMinute <= stats.total);
            REQUIRE(stats.uniqueTotal <= stats.total);
            REQUIRE(stats.total == i + 1);
        }
    }
}
