#include "taglimit/executor/ThreadPoolRunner.h"
#include "taglimit/common/Logger.h"

#include <pthread.h>

#include <cstdio>
#include <exception>
#include <stdexcept>

namespace taglimit {
namespace executor {

ThreadPoolRunner::ThreadPoolRunner(int numThreads, const std::string& name)
    : numThreads_(numThreads),
      name_(name) {
    if (numThreads_ <= 0) {
        throw std::invalid_argument("ThreadPoolRunner numThreads must be > 0");
    }
}

ThreadPoolRunner::~ThreadPoolRunner() {
    Shutdown();
    JoinAll();
}

void ThreadPoolRunner::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || shutdown_) return;
    started_ = true;

    threads_.reserve(static_cast<size_t>(numThreads_));
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(&ThreadPoolRunner::ThreadFunc, this, i);
        ++liveWorkers_;
    }
    LOG_INFO << "ThreadPoolRunner [" << name_ << "] started " << numThreads_ << " workers";
}

bool ThreadPoolRunner::Execute(Task task) {
    if (!task) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            LOG_DEBUG << "ThreadPoolRunner [" << name_ << "] reject task after shutdown";
            return false;
        }
        // Accepted work must be guaranteed a worker.
        if (!started_) {
            LOG_WARN << "ThreadPoolRunner [" << name_ << "] reject task before Start()";
            return false;
        }
        queue_.push_back(std::move(task));
    }
    notEmpty_.notify_one();
    return true;
}

void ThreadPoolRunner::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;
    }
    notEmpty_.notify_all();
    terminated_.notify_all();

    LOG_INFO << "ThreadPoolRunner [" << name_ << "] shutdown requested";
}

bool ThreadPoolRunner::AwaitTermination(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool done = terminated_.wait_for(lock, timeout, [this] {
            return shutdown_ && liveWorkers_ == 0 && queue_.empty();
        });
        if (!done) return false;
    }
    JoinAll();
    return true;
}

size_t ThreadPoolRunner::QueueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ThreadPoolRunner::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

unsigned long long ThreadPoolRunner::CompletedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

void ThreadPoolRunner::JoinAll() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(threads_);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

void ThreadPoolRunner::ThreadFunc(int index) {
    char buf[16];
    snprintf(buf, sizeof buf, "%s%d", name_.c_str(), index);
    if (int rc = ::pthread_setname_np(::pthread_self(), buf); rc != 0) {
        LOG_DEBUG << "ThreadPoolRunner [" << name_ << "] pthread_setname_np failed rc=" << rc;
    }

    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notEmpty_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (queue_.empty()) break; // shutdown and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR << "ThreadPoolRunner [" << name_ << "] task threw: " << e.what();
        } catch (...) {
            LOG_ERROR << "ThreadPoolRunner [" << name_ << "] task threw a non-standard exception";
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            ++completed_;
        }
    }

    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last = (--liveWorkers_ == 0);
    }
    if (last) terminated_.notify_all();
    LOG_DEBUG << "ThreadPoolRunner [" << name_ << "] worker " << index << " exit";
}

} // namespace executor
} // namespace taglimit
