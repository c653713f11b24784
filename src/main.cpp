#include "taglimit/common/Config.h"
#include "taglimit/common/Logger.h"
#include "taglimit/executor/ThreadPoolRunner.h"
#include "taglimit/limiter/TaggedLimiter.h"

#include <getopt.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

bool waitDrained(const taglimit::limiter::TaggedLimiter& limiter, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        bool idle = true;
        for (const auto& s : limiter.Snapshot()) {
            if (s.running > 0 || s.hasPending) {
                idle = false;
                break;
            }
        }
        if (idle) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace taglimit;

    std::string configFile = "../config/taglimit.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    common::Config conf;
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const int limit = conf.GetInt("limiter", "max_concurrent_per_tag", 2);
    const int threads = conf.GetInt("runner", "threads", 4);
    const std::string runnerName = conf.GetString("runner", "name", "worker");
    const std::vector<std::string> tags = conf.GetList("demo", "tags", {"a", "b"});
    const int perTag = conf.GetInt("demo", "submissions_per_tag", 8);
    const int taskMs = conf.GetInt("demo", "task_ms", 20);

    if (checkOnly) {
        // Exit code indicates success/failure for management scripts/CI.
        if (limit < 0 || threads <= 0) {
            printf("INVALID: max_concurrent_per_tag must be >= 0 and threads > 0\n");
            return 1;
        }
        printf("OK\n");
        return 0;
    }

    try {
        executor::ThreadPoolRunner runner(threads, runnerName);
        runner.Start();
        limiter::TaggedLimiter tagLimiter(runner, limit);

        std::map<std::string, std::atomic<int>> executed;
        for (const auto& tag : tags) executed[tag] = 0;

        int queued = 0;
        for (int i = 0; i < perTag; ++i) {
            for (const auto& tag : tags) {
                std::atomic<int>* counter = &executed[tag];
                const bool parked = tagLimiter.Submit(tag, [counter, taskMs] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(taskMs));
                    counter->fetch_add(1);
                });
                if (parked) ++queued;
            }
        }
        LOG_INFO << "Submitted " << perTag * static_cast<int>(tags.size()) << " tasks, " << queued
                 << " parked as pending";

        const auto budget = std::chrono::milliseconds(taskMs * (perTag + 2) + 1000);
        if (!waitDrained(tagLimiter, budget)) {
            LOG_WARN << "Limiter did not drain within " << budget.count() << "ms";
        }

        runner.Shutdown();
        if (!runner.AwaitTermination(std::chrono::seconds(5))) {
            LOG_ERROR << "Runner did not terminate in time";
            return 1;
        }

        for (const auto& s : tagLimiter.Snapshot()) {
            printf("tag=%s executed=%d dispatched=%llu dropped=%llu\n",
                   s.tag.c_str(), executed[s.tag].load(), s.dispatched, s.dropped);
        }
    } catch (const std::invalid_argument& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        return 1;
    }

    return 0;
}
