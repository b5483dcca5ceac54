#include "test_support.hpp"

#include "kscope/viewer_poller.hpp"

using namespace kscope;

TEST_CASE("Viewer poller publishes the first count immediately", "[viewers]") {
    SessionState state(0);
    std::optional<qint64> next = 1500;
    ViewerPoller poller(&state, "xqc", [&next]() { return next; }, 60'000);

    poller.start();
    REQUIRE(state.viewerCount() == 1500);
    REQUIRE(poller.refreshCount() == 1);

    SECTION("a failed refresh resets the count to unknown") {
        next = std::nullopt;
        poller.refresh();
        REQUIRE_FALSE(state.viewerCount().has_value());
    }
    SECTION("later refreshes replace the count") {
        next = 1750;
        poller.refresh();
        REQUIRE(state.viewerCount() == 1750);
        REQUIRE(poller.refreshCount() == 2);
    }
    poller.stop();
}

TEST_CASE("Viewer poller refreshes on its interval", "[viewers][slow]") {
    SessionState state(0, 10);
    int calls = 0;
    ViewerPoller poller(&state, "xqc", [&calls]() -> std::optional<qint64> {
        calls++;
        return calls * 100;
    }, 50);

    poller.start();
    REQUIRE(test::waitUntil([&calls]() { return calls >= 3; }, 2'000));
    poller.stop();
    REQUIRE(state.viewerCount().value_or(0) >= 300);
}

TEST_CASE("Viewer poller runs on a worker thread", "[viewers][concurrency]") {
    SessionState state(0);
    QThread thread;
    auto* poller = new ViewerPoller(&state, "xqc", []() -> std::optional<qint64> { return 42; }, 60'000);
    poller->moveToThread(&thread);
    QObject::connect(&thread, &QThread::started, poller, &ViewerPoller::start);
    QObject::connect(&thread, &QThread::finished, poller, &QObject::deleteLater);
    thread.start();

    REQUIRE(test::waitUntil([&state]() { return state.viewerCount().has_value(); }, 2'000));
    REQUIRE(state.viewerCount() == 42);
    thread.quit();
    REQUIRE(thread.wait(2'000));
}
