#include "taglimit/executor/ThreadPoolRunner.h"
#include "taglimit/limiter/TaggedLimiter.h"
#include "taglimit/common/Logger.h"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using taglimit::common::Logger;
using taglimit::executor::ThreadPoolRunner;
using taglimit::limiter::TaggedLimiter;

namespace {

// A task body that records it has started and then blocks until released.
class GatedTask {
public:
    void operator()() {
        std::unique_lock<std::mutex> lock(mu_);
        started_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mu_);
        released_ = true;
        cv_.notify_all();
    }

    bool WaitStarted(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, timeout, [this] { return started_; });
    }

    bool HasRun() {
        std::lock_guard<std::mutex> lock(mu_);
        return started_;
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    bool started_{false};
    bool released_{false};
};

auto Ref(GatedTask& t) {
    return [&t] { t(); };
}

constexpr auto kWait = std::chrono::seconds(2);
constexpr auto kSettle = std::chrono::milliseconds(100);

bool WaitIdle(const TaggedLimiter& limiter, const std::string& tag) {
    const auto deadline = std::chrono::steady_clock::now() + kWait;
    while (std::chrono::steady_clock::now() < deadline) {
        auto s = limiter.GetStats(tag);
        if (s && s->running == 0 && !s->hasPending) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

void Finish(ThreadPoolRunner& runner) {
    runner.Shutdown();
    assert(runner.AwaitTermination(kWait));
}

} // namespace

static void testLimit() {
    ThreadPoolRunner runner(4, "limit");
    runner.Start();
    TaggedLimiter limiter(runner, 2);

    GatedTask a1, a2, a3, b1;
    assert(!limiter.Submit("a", Ref(a1)));
    assert(!limiter.Submit("a", Ref(a2)));
    assert(limiter.Submit("a", Ref(a3)));
    assert(!limiter.Submit("b", Ref(b1)));

    assert(a1.WaitStarted(kWait));
    assert(a2.WaitStarted(kWait));
    assert(b1.WaitStarted(kWait));
    std::this_thread::sleep_for(kSettle);
    assert(!a3.HasRun());

    // b is not held back by a being at its limit.
    b1.Release();
    assert(WaitIdle(limiter, "b"));
    assert(!a3.HasRun());

    a1.Release();
    a2.Release();
    a3.Release();
    assert(a3.WaitStarted(kWait));
    assert(WaitIdle(limiter, "a"));
    Finish(runner);
}

static void testPendingRuns() {
    ThreadPoolRunner runner(4, "pending");
    runner.Start();
    TaggedLimiter limiter(runner, 2);

    GatedTask a1, a2, a3;
    limiter.Submit("a", Ref(a1));
    limiter.Submit("a", Ref(a2));
    limiter.Submit("a", Ref(a3));
    assert(a1.WaitStarted(kWait));
    assert(a2.WaitStarted(kWait));

    // let a1 finish, should trigger a3 to run
    a1.Release();
    assert(a3.WaitStarted(kWait));
    auto s = limiter.GetStats("a");
    assert(s->running == 2 && !s->hasPending);

    a2.Release();
    a3.Release();
    assert(WaitIdle(limiter, "a"));
    Finish(runner);
}

static void testPendingRunsIntermediateDropped() {
    ThreadPoolRunner runner(4, "dropped");
    runner.Start();
    TaggedLimiter limiter(runner, 2);

    GatedTask a1, a2, a3, a4;
    assert(!limiter.Submit("a", Ref(a1)));
    assert(!limiter.Submit("a", Ref(a2)));
    assert(limiter.Submit("a", Ref(a3)));
    assert(limiter.Submit("a", Ref(a4)));
    assert(a1.WaitStarted(kWait));

    a1.Release();
    assert(a4.WaitStarted(kWait));

    a2.Release();
    a4.Release();
    assert(WaitIdle(limiter, "a"));
    Finish(runner);

    // pending a3 should have been dropped when a4 was submitted
    assert(!a3.HasRun());
    auto s = limiter.GetStats("a");
    assert(s->dispatched == 3 && s->dropped == 1);
}

static void testSingleSubmission() {
    ThreadPoolRunner runner(2, "single");
    runner.Start();
    TaggedLimiter limiter(runner, 2);

    GatedTask a1;
    assert(!limiter.Submit("a", Ref(a1)));
    assert(a1.WaitStarted(kWait));
    auto s = limiter.GetStats("a");
    assert(s->running == 1 && !s->hasPending);

    a1.Release();
    assert(WaitIdle(limiter, "a"));
    Finish(runner);
}

static void testNonStandardThrowReleasesSlot() {
    ThreadPoolRunner runner(2, "throw");
    runner.Start();
    TaggedLimiter limiter(runner, 1);

    GatedTask blocker, next;
    assert(!limiter.Submit("a", [&blocker] {
        blocker();
        throw 42;
    }));
    assert(limiter.Submit("a", Ref(next)));
    assert(blocker.WaitStarted(kWait));

    blocker.Release();
    next.Release();
    assert(next.WaitStarted(kWait));
    assert(WaitIdle(limiter, "a"));
    Finish(runner);
}

int main() {
    Logger::Instance().SetLevel(taglimit::common::LogLevel::ERROR);
    testLimit();
    testPendingRuns();
    testPendingRunsIntermediateDropped();
    testSingleSubmission();
    testNonStandardThrowReleasesSlot();
    return 0;
}
