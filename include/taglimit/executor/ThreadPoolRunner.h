#pragma once

#include "taglimit/common/noncopyable.h"
#include "taglimit/executor/TaskRunner.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace taglimit {
namespace executor {

// Fixed-size worker pool draining one shared FIFO queue.
// - Execute() queues; workers pick tasks in submission order.
// - Execute() rejects work before Start() and after Shutdown(), so every
//   accepted task is guaranteed to run.
// - Shutdown() stops intake, already queued tasks still run.
// - Exceptions escaping a task are logged and do not kill the worker.
class ThreadPoolRunner : public TaskRunner, common::noncopyable {
public:
    explicit ThreadPoolRunner(int numThreads, const std::string& name = "worker");
    ~ThreadPoolRunner() override;

    void Start();

    bool Execute(Task task) override;

    void Shutdown();

    // Waits for the queue to drain and the workers to exit. Only meaningful after Shutdown().
    bool AwaitTermination(std::chrono::milliseconds timeout);

    int numThreads() const { return numThreads_; }
    const std::string& name() const { return name_; }

    // For tests/observability.
    size_t QueueSize() const;
    size_t ActiveCount() const;
    unsigned long long CompletedCount() const;

private:
    void ThreadFunc(int index);
    void JoinAll();

    const int numThreads_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable terminated_;
    std::deque<Task> queue_;
    std::vector<std::thread> threads_;
    bool started_{false};
    bool shutdown_{false};
    size_t active_{0};
    size_t liveWorkers_{0};
    unsigned long long completed_{0};
};

} // namespace executor
} // namespace taglimit
