// File: src/concurrency/worker_pool.cpp
#include "concurrency/worker_pool.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <fstream>
#include <unistd.h>

namespace dpcm {

bool WorkerPool::Config::IsValid() const {
    if (max_workers == 0) return false;
    if (min_workers > max_workers) return false;
    if (memory_pressure_mb == 0 || memory_critical_mb < memory_pressure_mb) return false;
    if (low_pressure_ratio <= 0.0 || low_pressure_ratio > 1.0) return false;
    if (task_timeout.count() <= 0 || scale_interval.count() <= 0) return false;
    if (watchdog_interval.count() <= 0 || shutdown_grace.count() < 0) return false;
    return max_batch_size > 0;
}

size_t WorkerPool::Config::EffectiveMinWorkers() const {
    if (min_workers > 0) {
        return min_workers;
    }
    return std::max<size_t>(1, max_workers / 2);
}

size_t WorkerPool::SampleProcessMemory() {
    std::ifstream statm("/proc/self/statm");
    size_t total_pages = 0;
    size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0;
    }
    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return 0;
    }
    return resident_pages * static_cast<size_t>(page_size);
}

// ============================================================================
// Construction and shutdown
// ============================================================================

WorkerPool::WorkerPool(const Config& config,
                       MemorySampler sampler,
                       std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      sampler_(sampler ? std::move(sampler) : MemorySampler(&WorkerPool::SampleProcessMemory)),
      logger_(logging::OrNull(std::move(logger), "worker_pool")),
      shared_(std::make_shared<Shared>()) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid WorkerPool configuration");
    }
    shared_->config = config_;
    shared_->logger = logger_;

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->target_workers = config_.EffectiveMinWorkers();
        SpawnLocked(shared_->target_workers);
    }

    monitor_running_.store(true);
    monitor_thread_ = std::make_unique<std::thread>(&WorkerPool::MonitorLoop, this);

    logger_->info("Worker pool started with {} workers (min {}, max {})",
                  config_.EffectiveMinWorkers(), config_.EffectiveMinWorkers(), config_.max_workers);
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

bool WorkerPool::IsShutdown() const {
    return shut_down_.load();
}

void WorkerPool::Shutdown(std::optional<std::chrono::milliseconds> grace) {
    if (shut_down_.exchange(true)) {
        return;
    }

    // Stop scaling and timeout checks first
    monitor_running_.store(false);
    monitor_cv_.notify_all();
    if (monitor_thread_ && monitor_thread_->joinable()) {
        monitor_thread_->join();
    }
    monitor_thread_.reset();

    std::deque<Job> rejected;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->stopping = true;
        rejected.swap(shared_->queue);
    }
    shared_->work_cv.notify_all();

    for (auto& job : rejected) {
        job.fail(std::make_exception_ptr(TaskRejectedError("worker pool shutting down")));
    }
    shared_->rejected.fetch_add(rejected.size(), std::memory_order_relaxed);
    if (!rejected.empty()) {
        logger_->info("Rejected {} queued tasks at shutdown", rejected.size());
    }

    std::unique_lock<std::mutex> lock(shared_->mutex);
    shared_->done_cv.wait_for(lock, grace.value_or(config_.shutdown_grace),
                              [this] { return shared_->live_workers == 0; });

    // Stragglers: fail their futures and let the threads run out on their own
    for (auto& job : shared_->running) {
        job.fail(std::make_exception_ptr(TaskTimeoutError("abandoned at shutdown")));
    }

    for (auto& slot : workers_) {
        if (slot->finished.load()) {
            if (slot->thread.joinable()) {
                lock.unlock();
                slot->thread.join();
                lock.lock();
            }
        } else {
            slot->thread.detach();
            force_terminated_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    workers_.clear();

    uint64_t abandoned = force_terminated_.load(std::memory_order_relaxed);
    if (abandoned > 0) {
        logger_->warn("Abandoned {} workers still running after shutdown grace period", abandoned);
    }
}

// ============================================================================
// Workers
// ============================================================================

void WorkerPool::SpawnLocked(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto slot = std::make_shared<WorkerSlot>();
        ++shared_->live_workers;
        slot->thread = std::thread(&WorkerPool::WorkerLoop, shared_, slot);
        workers_.push_back(std::move(slot));
    }
}

void WorkerPool::ReapFinishedLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->finished.load()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkerPool::WorkerLoop(std::shared_ptr<Shared> shared, std::shared_ptr<WorkerSlot> slot) {
    std::unique_lock<std::mutex> lock(shared->mutex);

    while (true) {
        shared->work_cv.wait(lock, [&] {
            return shared->stopping || !shared->queue.empty() ||
                   shared->live_workers > shared->target_workers;
        });

        if (shared->stopping || shared->live_workers > shared->target_workers) {
            break;
        }

        Job job = std::move(shared->queue.front());
        shared->queue.pop_front();
        job.state->started = std::chrono::steady_clock::now();
        auto running_it = shared->running.insert(shared->running.end(), job);
        ++shared->busy;

        lock.unlock();
        bool ok = job.run();
        lock.lock();

        shared->running.erase(running_it);
        --shared->busy;
        if (ok) {
            shared->completed.fetch_add(1, std::memory_order_relaxed);
        } else {
            shared->failed.fetch_add(1, std::memory_order_relaxed);
        }
    }

    --shared->live_workers;
    slot->finished.store(true);
    shared->done_cv.notify_all();
}

void WorkerPool::Enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->stopping && !shut_down_.load()) {
            shared_->queue.push_back(std::move(job));
            shared_->work_cv.notify_one();
            return;
        }
    }
    shared_->rejected.fetch_add(1, std::memory_order_relaxed);
    job.fail(std::make_exception_ptr(TaskRejectedError("worker pool is shut down")));
}

// ============================================================================
// Scaling and timeouts
// ============================================================================

WorkerPool::ScaleDecision WorkerPool::ScaleTick() {
    ScaleDecision decision;
    decision.memory_mb = sampler_() / (1024 * 1024);
    last_memory_mb_.store(decision.memory_mb, std::memory_order_relaxed);

    const size_t floor = config_.EffectiveMinWorkers();
    const size_t ceiling = config_.max_workers;
    const double low_mark = static_cast<double>(config_.memory_pressure_mb) * config_.low_pressure_ratio;

    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->stopping) {
        decision.previous = decision.target = shared_->target_workers;
        return decision;
    }
    ReapFinishedLocked();

    size_t current = shared_->target_workers;
    size_t target = current;
    if (decision.memory_mb >= config_.memory_critical_mb) {
        target = current > floor + 2 ? current - 2 : floor;
    } else if (decision.memory_mb >= config_.memory_pressure_mb) {
        target = current > floor + 1 ? current - 1 : floor;
    } else if (static_cast<double>(decision.memory_mb) < low_mark && !shared_->queue.empty()) {
        target = std::min(ceiling, current + 1);
    }
    target = std::clamp(target, floor, ceiling);

    decision.previous = current;
    decision.target = target;
    shared_->target_workers = target;

    if (target > current) {
        scale_ups_.fetch_add(1, std::memory_order_relaxed);
        logger_->info("Scaling workers up {} -> {} ({} MB)", current, target, decision.memory_mb);
    } else if (target < current) {
        scale_downs_.fetch_add(1, std::memory_order_relaxed);
        logger_->info("Scaling workers down {} -> {} ({} MB)", current, target, decision.memory_mb);
    }

    if (shared_->live_workers < target) {
        SpawnLocked(target - shared_->live_workers);
    } else if (shared_->live_workers > target) {
        // Idle workers above target retire
        shared_->work_cv.notify_all();
    }
    return decision;
}

void WorkerPool::CheckTimeouts() {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(shared_->mutex);
    for (auto& job : shared_->running) {
        if (job.state->settled.load()) {
            continue;
        }
        if (now - job.state->started > job.state->timeout) {
            job.fail(std::make_exception_ptr(TaskTimeoutError(
                "exceeded " + std::to_string(job.state->timeout.count()) + " ms")));
            shared_->timed_out.fetch_add(1, std::memory_order_relaxed);
            logger_->warn("Task timed out after {} ms", job.state->timeout.count());
        }
    }
}

void WorkerPool::MonitorLoop() {
    auto last_scale = std::chrono::steady_clock::now();
    while (monitor_running_.load()) {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, config_.watchdog_interval,
                                 [this] { return !monitor_running_.load(); });
        }
        if (!monitor_running_.load()) {
            break;
        }

        CheckTimeouts();

        auto now = std::chrono::steady_clock::now();
        if (config_.auto_scale && now - last_scale >= config_.scale_interval) {
            ScaleTick();
            last_scale = now;
        }
    }
}

size_t WorkerPool::OptimalBatchSize(size_t total_items) const {
    size_t workers;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        workers = std::max<size_t>(1, shared_->live_workers);
    }
    size_t per_worker = (total_items + workers - 1) / workers;
    return std::clamp<size_t>(per_worker, 1, config_.max_batch_size);
}

WorkerPool::Stats WorkerPool::GetStats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        stats.workers = shared_->live_workers;
        stats.target_workers = shared_->target_workers;
        stats.busy = shared_->busy;
        stats.queued = shared_->queue.size();
    }
    stats.min_workers = config_.EffectiveMinWorkers();
    stats.max_workers = config_.max_workers;
    stats.completed = shared_->completed.load(std::memory_order_relaxed);
    stats.failed = shared_->failed.load(std::memory_order_relaxed);
    stats.timed_out = shared_->timed_out.load(std::memory_order_relaxed);
    stats.rejected = shared_->rejected.load(std::memory_order_relaxed);
    stats.force_terminated = force_terminated_.load(std::memory_order_relaxed);
    stats.scale_ups = scale_ups_.load(std::memory_order_relaxed);
    stats.scale_downs = scale_downs_.load(std::memory_order_relaxed);
    stats.last_memory_mb = last_memory_mb_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace dpcm
