#include "executors/action_worker_pool.hpp"

namespace trustnet {

ActionWorkerPool::ActionWorkerPool(size_t threads) {
    if (threads == 0) threads = 1;
    running_ = true;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

ActionWorkerPool::~ActionWorkerPool() {
    stop();
}

ActionWorkerPool::Submission ActionWorkerPool::submit(Job job) {
    auto task = std::make_shared<Task>();
    task->job = std::move(job);
    Submission submission;
    submission.result = task->promise.get_future();
    submission.started = task->started.get_future();
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_) {
            queue_.push(task);
            cv_.notify_one();
            return submission;
        }
    }
    task->started.set_value(now());
    task->promise.set_value(Result<ActionResult>::failure(
        Status::error(ErrorKind::ExecutorFailure, "Worker pool is stopped")));
    return submission;
}

void ActionWorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ActionWorkerPool::workerLoop() {
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (queue_.empty()) return;
            task = queue_.front();
            queue_.pop();
        }

        task->started.set_value(now());
        try {
            task->promise.set_value(task->job());
        } catch (const std::exception& e) {
            task->promise.set_value(Result<ActionResult>::failure(
                Status::error(ErrorKind::ExecutorFailure,
                              std::string("Executor threw: ") + e.what())));
        } catch (...) {
            task->promise.set_value(Result<ActionResult>::failure(
                Status::error(ErrorKind::ExecutorFailure, "Executor threw an unknown exception")));
        }
    }
}

} // namespace trustnet
