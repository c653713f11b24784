#include "taglimit/limiter/TaggedLimiter.h"
#include "taglimit/common/Logger.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace taglimit {
namespace limiter {

using executor::Task;
using executor::TaskRunner;

// Book keeping per tag. All fields are guarded by mutex_; the runner is never
// called with mutex_ held.
class TaggedLimiter::Slot : public std::enable_shared_from_this<TaggedLimiter::Slot>,
                            common::noncopyable {
public:
    Slot(const std::string& tag, int limit, TaskRunner& runner)
        : tag_(tag), limit_(limit), runner_(runner) {}

    bool Run(Task task);

    SlotStats Stats() const {
        SlotStats s;
        s.tag = tag_;
        std::lock_guard<std::mutex> lock(mutex_);
        s.running = running_;
        s.hasPending = static_cast<bool>(pending_);
        s.dispatched = dispatched_;
        s.dropped = dropped_;
        return s;
    }

private:
    // Calls OnTaskFinished() when the wrapped task leaves scope, returned or thrown.
    class FinishGuard {
    public:
        explicit FinishGuard(Slot& slot) : slot_(slot) {}
        ~FinishGuard() { slot_.OnTaskFinished(); }

        FinishGuard(const FinishGuard&) = delete;
        FinishGuard& operator=(const FinishGuard&) = delete;

    private:
        Slot& slot_;
    };

    void Dispatch(Task task);
    void OnTaskFinished();

    const std::string tag_;
    const int limit_;
    TaskRunner& runner_;

    mutable std::mutex mutex_;
    int running_{0};
    Task pending_;
    unsigned long long dispatched_{0};
    unsigned long long dropped_{0};
};

bool TaggedLimiter::Slot::Run(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        LOG_DEBUG << tag_ << ": run() running=" << running_ << " limit=" << limit_;

        if (running_ > limit_) {
            LOG_WARN << tag_ << ": running count (" << running_ << ") greater than the limit ("
                     << limit_ << "), clamping";
            running_ = limit_;
        }
        if (running_ == limit_) {
            if (pending_) {
                ++dropped_;
                LOG_DEBUG << tag_ << ": at limit " << limit_ << ", replacing pending task";
            } else {
                LOG_DEBUG << tag_ << ": at limit " << limit_ << ", setting pending task";
            }
            pending_ = std::move(task);
            return true;
        }

        ++running_;
        ++dispatched_;
    }

    LOG_DEBUG << tag_ << ": running";
    Dispatch(std::move(task));
    return false;
}

void TaggedLimiter::Slot::Dispatch(Task task) {
    auto self = shared_from_this();
    bool accepted = false;
    try {
        accepted = runner_.Execute([self, task = std::move(task)]() {
            FinishGuard guard(*self);
            task();
        });
    } catch (const std::exception& e) {
        LOG_ERROR << tag_ << ": runner threw while accepting task: " << e.what();
    } catch (...) {
        LOG_ERROR << tag_ << ": runner threw a non-standard exception while accepting task";
    }
    if (accepted) return;

    Task next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        LOG_WARN << tag_ << ": runner rejected task, releasing its running slot";
        if (running_ > 0) --running_;
        if (dispatched_ > 0) --dispatched_;

        // A submission may have parked while the reserved slot looked taken.
        if (!pending_ || running_ >= limit_) return;
        next = std::move(pending_);
        pending_ = nullptr;
    }

    LOG_DEBUG << tag_ << ": running pending task after rejection";
    if (Run(std::move(next))) {
        LOG_DEBUG << tag_ << ": pending task parked again, no free running slot";
    }
}

void TaggedLimiter::Slot::OnTaskFinished() {
    Task next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ <= 0) {
            LOG_WARN << tag_ << ": task finished but running count is " << running_
                     << ", finished callback mismatch";
            running_ = 1;
        }

        LOG_DEBUG << tag_ << ": task finished";
        --running_;
        if (!pending_) return;

        next = std::move(pending_);
        pending_ = nullptr;
    }

    LOG_DEBUG << tag_ << ": running pending task";
    if (Run(std::move(next))) {
        LOG_DEBUG << tag_ << ": pending task parked again, no free running slot";
    }
}

TaggedLimiter::TaggedLimiter(TaskRunner& runner, int maxConcurrentPerTag)
    : runner_(runner),
      limit_(maxConcurrentPerTag) {
    if (limit_ < 0) {
        throw std::invalid_argument("TaggedLimiter maxConcurrentPerTag must be >= 0");
    }
    if (limit_ == 0) {
        LOG_WARN << "TaggedLimiter created with limit 0, submitted tasks will never run";
    }
}

TaggedLimiter::~TaggedLimiter() = default;

bool TaggedLimiter::Submit(const std::string& tag, Task task) {
    if (!task) {
        LOG_WARN << tag << ": ignoring empty task";
        return false;
    }
    return GetOrCreateSlot(tag)->Run(std::move(task));
}

std::shared_ptr<TaggedLimiter::Slot> TaggedLimiter::GetOrCreateSlot(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(tag);
    if (it == slots_.end()) {
        it = slots_.emplace(tag, std::make_shared<Slot>(tag, limit_, runner_)).first;
    }
    return it->second;
}

size_t TaggedLimiter::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::optional<TaggedLimiter::SlotStats> TaggedLimiter::GetStats(const std::string& tag) const {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(tag);
        if (it == slots_.end()) return std::nullopt;
        slot = it->second;
    }
    return slot->Stats();
}

std::vector<TaggedLimiter::SlotStats> TaggedLimiter::Snapshot() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.reserve(slots_.size());
        for (const auto& kv : slots_) slots.push_back(kv.second);
    }

    std::vector<SlotStats> out;
    out.reserve(slots.size());
    for (const auto& s : slots) out.push_back(s->Stats());
    return out;
}

} // namespace limiter
} // namespace taglimit
