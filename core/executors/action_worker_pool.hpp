#pragma once

#include "common/clock.hpp"
#include "executors/action_executor.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace trustnet {

// ─── Action Worker Pool ────────────────────────────────────────
// Fixed set of threads running executor attempts. Callers wait on the
// returned futures with their own deadline; an attempt that outlives its
// deadline keeps its worker until the executor returns.

class ActionWorkerPool {
public:
    using Job = std::function<Result<ActionResult>()>;

    explicit ActionWorkerPool(size_t threads);
    ~ActionWorkerPool();

    ActionWorkerPool(const ActionWorkerPool&) = delete;
    ActionWorkerPool& operator=(const ActionWorkerPool&) = delete;

    /// `started` is set when a worker picks the job up, so callers can
    /// measure run time without the time spent queued.
    struct Submission {
        std::future<Result<ActionResult>> result;
        std::future<Timestamp> started;
    };

    /// Queue a job. Anything the job throws becomes an ExecutorFailure
    /// result. After stop() both futures are already satisfied.
    Submission submit(Job job);

    /// Stop accepting work and join the workers once the queue drains.
    void stop();

    size_t size() const { return workers_.size(); }

private:
    struct Task {
        Job job;
        std::promise<Result<ActionResult>> promise;
        std::promise<Timestamp> started;
    };

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::queue<std::shared_ptr<Task>> queue_;
    std::mutex mu_;
    std::condition_variable cv_;

    void workerLoop();
};

} // namespace trustnet
