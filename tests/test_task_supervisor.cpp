#include <doctest/doctest.h>
#include "fakes.hpp"

#include <atomic>
#include <stdexcept>

#include "kdc/task_supervisor.hpp"

using namespace kdc_test;

TEST_CASE("A task that throws is restarted and its neighbours keep running") {
    TaskSupervisor sup(10);
    std::atomic<int> crashes{0};
    std::atomic<int> steady_loops{0};

    sup.spawn("crashy", [&crashes](const CancelToken&) {
        if (++crashes <= 3) throw std::runtime_error("socket vanished");
    });
    sup.spawn("steady", [&steady_loops](const CancelToken& cancel) {
        while (!cancel.cancelled()) {
            ++steady_loops;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    REQUIRE(wait_until([&] { return crashes.load() >= 4; }));
    // The fourth run returned normally: finished, not restarted.
    REQUIRE(wait_until([&] { return sup.running() == 1; }));
    CHECK(sup.restarts("crashy") == 3);
    CHECK(sup.restarts("steady") == 0);
    const int before = steady_loops.load();
    REQUIRE(wait_until([&] { return steady_loops.load() > before; }));

    sup.stop();
    CHECK(sup.running() == 0);
    sup.stop();
}

TEST_CASE("Stop does not wait out a long restart delay") {
    TaskSupervisor sup(60000);
    std::atomic<int> runs{0};
    sup.spawn("always-fails", [&runs](const CancelToken&) {
        ++runs;
        throw std::runtime_error("boom");
    });
    REQUIRE(wait_until([&] { return runs.load() == 1; }));

    const auto t0 = std::chrono::steady_clock::now();
    sup.stop();
    const auto waited = std::chrono::steady_clock::now() - t0;
    CHECK(waited < std::chrono::seconds(2));
    CHECK(runs.load() == 1);
    CHECK(sup.restarts("unknown") == 0);
}
