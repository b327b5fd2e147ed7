#include <doctest/doctest.h>
#include "hopmesh/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace hopmesh;

namespace {

// Poll `pred` for up to two seconds.
template <typename Pred>
bool eventually(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace

TEST_CASE("A scheduled task runs repeatedly until cancelled") {
    TaskScheduler sched;
    std::atomic<int> count{0};
    const auto id = sched.schedule_every("tick", 5, [&] { ++count; });
    REQUIRE(id != TaskScheduler::INVALID_TASK);
    CHECK(sched.task_count() == 1);

    CHECK(eventually([&] { return count.load() >= 3; }));
    CHECK(sched.runs(id) >= 2);

    CHECK(sched.cancel(id));
    CHECK_FALSE(sched.cancel(id));
    CHECK(sched.task_count() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const int after = count.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    CHECK(count.load() == after);
}

TEST_CASE("Bad requests get no task id") {
    TaskScheduler sched;
    CHECK(sched.schedule_every("zero", 0, [] {}) == TaskScheduler::INVALID_TASK);
    CHECK(sched.schedule_every("empty", 10, TaskScheduler::TaskFn()) == TaskScheduler::INVALID_TASK);

    sched.stop();
    CHECK_FALSE(sched.running());
    CHECK(sched.schedule_every("late", 10, [] {}) == TaskScheduler::INVALID_TASK);
}

TEST_CASE("A throwing task keeps its schedule") {
    TaskScheduler sched;
    std::atomic<int> count{0};
    sched.schedule_every("flaky", 5, [&] {
        ++count;
        throw std::runtime_error("boom");
    });
    CHECK(eventually([&] { return count.load() >= 3; }));
}

TEST_CASE("Independent tasks keep their own cadence") {
    TaskScheduler sched;
    std::atomic<int> fast{0}, slow{0};
    sched.schedule_every("fast", 5, [&] { ++fast; });
    sched.schedule_every("slow", 1000, [&] { ++slow; });

    CHECK(eventually([&] { return fast.load() >= 5; }));
    CHECK(slow.load() == 0);
    CHECK(sched.task_count() == 2);

    sched.stop();
    sched.stop();   // idempotent
    CHECK(sched.task_count() == 0);
}
