#pragma once

#include "taglimit/common/noncopyable.h"
#include "taglimit/executor/TaskRunner.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taglimit {
namespace limiter {

// Imposes a concurrency limit on each tag, keeping at most one pending task per tag.
// A task submitted while its tag is at the limit replaces the pending one; the
// replaced task is dropped without running or notification. Only suitable where
// the most recent request per tag is the one that matters (e.g. refreshes).
//
// Tasks are run through the supplied TaskRunner, which must outlive every task
// handed to it by this limiter.
class TaggedLimiter : common::noncopyable {
public:
    struct SlotStats {
        std::string tag;
        int running{0};
        bool hasPending{false};
        unsigned long long dispatched{0}; // handed to the runner
        unsigned long long dropped{0};    // pending tasks superseded before running
    };

    // Throws std::invalid_argument if maxConcurrentPerTag < 0. A limit of 0 is
    // legal: every submission is parked as pending and nothing ever runs.
    TaggedLimiter(executor::TaskRunner& runner, int maxConcurrentPerTag);
    ~TaggedLimiter();

    // Runs the task now if the tag is under its limit, otherwise makes it the
    // tag's pending task, to run once a running task for the tag finishes.
    // Returns true if the task was queued in the pending slot (and may still be
    // dropped), false if it was handed to the runner.
    bool Submit(const std::string& tag, executor::Task task);

    int limit() const { return limit_; }

    // Number of distinct tags seen so far. Slots are never evicted.
    size_t Size() const;

    std::optional<SlotStats> GetStats(const std::string& tag) const;
    std::vector<SlotStats> Snapshot() const;

private:
    class Slot;

    std::shared_ptr<Slot> GetOrCreateSlot(const std::string& tag);

    executor::TaskRunner& runner_;
    const int limit_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace limiter
} // namespace taglimit
