// worker_pool.h
// Fixed-size pool of blocking worker threads that runs the proxy calls
// offloaded by the pool executor. Header-only.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#if defined(__linux__)
#include <pthread.h>
#endif

#include <spdlog/spdlog.h>

namespace accumulo::worker {

class WorkerPool {
public:
    struct Options {
        std::size_t thread_count = 1;

        // If true, shutdown() runs the tasks still queued before the threads exit.
        bool drain_on_shutdown = true;

        // Thread name prefix, shown by debuggers and top -H.
        std::string name;
    };

    using Task = std::function<void()>;

    explicit WorkerPool(Options options)
        : options_{normalize(std::move(options))}
        , drain_on_shutdown_{options_.drain_on_shutdown}
    {
        start_threads();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        shutdown(options_.drain_on_shutdown);
    }

    // Returns false once the pool is stopping; the task is then not run.
    bool post(Task task) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_stopping_.load(std::memory_order_acquire)) return false;
        queue_.push_back(std::move(task));
        task_cv_.notify_one();
        return true;
    }

    // Stops accepting work and joins every thread. With drain == true the
    // queued tasks run first, otherwise they are dropped. In-flight tasks
    // always finish.
    void shutdown(bool drain) noexcept {
        bool expected = false;
        if (!is_stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }

        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drain_on_shutdown_ = drain;
            if (!drain_on_shutdown_) {
                dropped = queue_.size();
                queue_.clear();
            }
        }
        if (dropped > 0) {
            spdlog::warn("Worker pool '{}' dropped {} queued tasks on shutdown", options_.name, dropped);
        }

        task_cv_.notify_all();
        for (auto& t : threads_) {
            t.request_stop();
        }
        // ~jthread joins
        threads_.clear();
    }

    std::size_t thread_count() const noexcept { return options_.thread_count; }
    std::size_t queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
    std::size_t active() const noexcept { return active_.load(std::memory_order_relaxed); }
    bool is_stopping() const noexcept { return is_stopping_.load(std::memory_order_acquire); }

private:
    static Options normalize(Options opts) {
        if (opts.thread_count == 0) opts.thread_count = 1;
        return opts;
    }

    void start_threads() {
        threads_.reserve(options_.thread_count);
        for (std::size_t i = 0; i < options_.thread_count; ++i) {
            threads_.emplace_back([this, i](std::stop_token st) {
#if defined(__linux__)
                if (!options_.name.empty()) {
                    std::string nm = options_.name + "-" + std::to_string(i);
                    constexpr std::size_t limit = 15; // Linux pthread name limit
                    if (nm.size() > limit) nm.resize(limit);
                    pthread_setname_np(pthread_self(), nm.c_str());
                }
#endif
                worker_loop(std::move(st));
            });
        }
    }

    void worker_loop(std::stop_token st) noexcept {
        std::stop_callback on_stop{st, [this] { task_cv_.notify_all(); }};
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                task_cv_.wait(lock, [&] { return !queue_.empty() || is_stopping_.load(std::memory_order_acquire); });
                if (queue_.empty()) {
                    break;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }

            active_.fetch_add(1, std::memory_order_relaxed);
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("Worker pool '{}' task threw: {}", options_.name, e.what());
            }
            active_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    Options options_{};
    std::vector<std::jthread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable task_cv_;
    std::deque<Task> queue_;

    std::atomic<bool> is_stopping_{false};
    bool drain_on_shutdown_{true};
    std::atomic<std::size_t> active_{0};
};

} // namespace accumulo::worker
