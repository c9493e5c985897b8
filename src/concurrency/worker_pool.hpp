// File: src/concurrency/worker_pool.hpp
//
// Memory-aware worker pool
//
// Runs submitted tasks on a set of worker threads whose size moves between
// a floor and a ceiling according to sampled process memory:
//
//   memory >= critical          shrink by 2
//   memory >= pressure          shrink by 1
//   memory <  pressure * ratio  grow by 1 if work is queued
//
// Each task has a timeout. A task that overruns it has its future failed
// with TaskTimeoutError; the thread running it is not interrupted.
//
// Shutdown rejects everything still queued (TaskRejectedError), waits a
// grace period for running tasks, then abandons the stragglers. Workers
// share their state through a shared_ptr, so an abandoned thread never
// touches a destroyed pool.

#pragma once

#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace dpcm {

class WorkerPool {
public:
    struct Config {
        size_t max_workers{4};
        size_t min_workers{0};                          ///< 0 = max(1, max_workers / 2)
        size_t memory_pressure_mb{256};
        size_t memory_critical_mb{384};
        double low_pressure_ratio{0.7};
        std::chrono::milliseconds task_timeout{30000};
        std::chrono::milliseconds scale_interval{1000};
        std::chrono::milliseconds watchdog_interval{50};
        std::chrono::milliseconds shutdown_grace{5000};
        size_t max_batch_size{20};
        bool auto_scale{true};

        bool IsValid() const;

        /// min_workers with the default applied
        size_t EffectiveMinWorkers() const;
    };

    /// Returns resident memory in bytes
    using MemorySampler = std::function<size_t()>;

    /// Resident set size from /proc/self/statm; 0 if unavailable
    static size_t SampleProcessMemory();

    struct ScaleDecision {
        size_t previous{0};
        size_t target{0};
        size_t memory_mb{0};
    };

    struct Stats {
        size_t workers{0};
        size_t target_workers{0};
        size_t min_workers{0};
        size_t max_workers{0};
        size_t busy{0};
        size_t queued{0};
        uint64_t completed{0};
        uint64_t failed{0};
        uint64_t timed_out{0};
        uint64_t rejected{0};
        uint64_t force_terminated{0};
        uint64_t scale_ups{0};
        uint64_t scale_downs{0};
        size_t last_memory_mb{0};
    };

    explicit WorkerPool(const Config& config,
                        MemorySampler sampler = nullptr,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task
    ///
    /// The future carries the task's result or exception, TaskTimeoutError
    /// if it overran `timeout` (default: Config::task_timeout), or
    /// TaskRejectedError if the pool shut down first.
    template<typename F>
    auto Submit(F&& task, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /// Apply one scaling step now
    ScaleDecision ScaleTick();

    /// Items per batch so `total_items` spreads over the live workers,
    /// clamped to [1, max_batch_size]
    size_t OptimalBatchSize(size_t total_items) const;

    /// Reject queued work, wait up to `grace` (default: Config::shutdown_grace)
    /// for running tasks, abandon the rest
    void Shutdown(std::optional<std::chrono::milliseconds> grace = std::nullopt);

    bool IsShutdown() const;

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    /// Settlement guard: exactly one of result, timeout or rejection wins
    struct TaskState {
        std::atomic<bool> settled{false};
        std::chrono::steady_clock::time_point started;
        std::chrono::milliseconds timeout{0};

        bool Claim() { return !settled.exchange(true); }
    };

    struct Job {
        std::shared_ptr<TaskState> state;
        std::function<bool()> run;     ///< false if the task threw
        std::function<void(std::exception_ptr)> fail;
    };

    struct WorkerSlot {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    /// State shared with worker threads
    struct Shared {
        Config config;
        std::shared_ptr<spdlog::logger> logger;

        mutable std::mutex mutex;
        std::condition_variable work_cv;
        std::condition_variable done_cv;
        std::deque<Job> queue;
        std::list<Job> running;
        size_t live_workers{0};
        size_t target_workers{0};
        size_t busy{0};
        bool stopping{false};

        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> timed_out{0};
        std::atomic<uint64_t> rejected{0};
    };

    static void WorkerLoop(std::shared_ptr<Shared> shared, std::shared_ptr<WorkerSlot> slot);

    void Enqueue(Job job);
    void SpawnLocked(size_t count);
    void ReapFinishedLocked();
    void CheckTimeouts();
    void MonitorLoop();

    Config config_;
    MemorySampler sampler_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<Shared> shared_;

    std::list<std::shared_ptr<WorkerSlot>> workers_;   ///< Guarded by shared_->mutex

    std::unique_ptr<std::thread> monitor_thread_;
    std::atomic<bool> monitor_running_{false};
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;

    std::atomic<bool> shut_down_{false};
    std::atomic<uint64_t> force_terminated_{0};
    std::atomic<uint64_t> scale_ups_{0};
    std::atomic<uint64_t> scale_downs_{0};
    std::atomic<size_t> last_memory_mb_{0};
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename F>
auto WorkerPool::Submit(F&& task, std::optional<std::chrono::milliseconds> timeout)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    Job job;
    job.state = std::make_shared<TaskState>();
    job.state->timeout = timeout.value_or(config_.task_timeout);

    std::shared_ptr<TaskState> state = job.state;
    job.run = [promise, state, fn = std::forward<F>(task)]() mutable -> bool {
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                if (state->Claim()) promise->set_value();
            } else {
                Result value = fn();
                if (state->Claim()) promise->set_value(std::move(value));
            }
            return true;
        } catch (...) {
            // Delivered to the caller through the future
            if (state->Claim()) promise->set_exception(std::current_exception());
            return false;
        }
    };
    job.fail = [promise, state](std::exception_ptr error) {
        if (state->Claim()) promise->set_exception(error);
    };

    Enqueue(std::move(job));
    return future;
}

} // namespace dpcm
