#pragma once

#include "fleetrun/engine/observability.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fleetrun {
namespace engine {

/**
 * Fixed-size thread pool for background work: fire-and-forget workflow
 * calls and scheduled runs. Destruction drains queued tasks, then joins.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int threads,
                        std::shared_ptr<Observability> observability = nullptr,
                        std::string name = "background")
        : name_(std::move(name)), observability_(std::move(observability)) {
        int count = threads < 1 ? 1 : threads;
        workers_.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutting_down_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.push_back(std::move(task));
        }
        wake_.notify_one();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t active() const { return active_.load(); }
    size_t size() const { return workers_.size(); }
    const std::string& name() const { return name_; }

private:
    void worker_loop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return shutting_down_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            ++active_;
            try {
                task();
            } catch (const std::exception& e) {
                if (observability_) {
                    observability_->log_error("Background task failed", {},
                                              {{"pool", name_}, {"error", e.what()}});
                }
            }
            --active_;
        }
    }

    std::string name_;
    std::shared_ptr<Observability> observability_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> tasks_;
    std::atomic<size_t> active_{0};
    bool shutting_down_ = false;
    std::vector<std::thread> workers_;
};

} // namespace engine
} // namespace fleetrun
