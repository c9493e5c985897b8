// File: src/concurrency/writer_priority_mutex.hpp
//
// Readers-writer mutex that favours writers
//
// Any number of readers may hold the lock together. Once a writer is
// waiting, new readers block until it has finished, so a steady stream of
// queries cannot starve structural updates. Meets the SharedMutex
// requirements, so std::shared_lock / std::unique_lock work with it.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace dpcm {

class WriterPriorityMutex {
public:
    WriterPriorityMutex() = default;
    WriterPriorityMutex(const WriterPriorityMutex&) = delete;
    WriterPriorityMutex& operator=(const WriterPriorityMutex&) = delete;

    // Exclusive ownership

    void lock() {
        std::unique_lock<std::mutex> guard(mutex_);
        ++waiting_writers_;
        writer_cv_.wait(guard, [this] { return !writer_active_ && active_readers_ == 0; });
        --waiting_writers_;
        writer_active_ = true;
    }

    bool try_lock() {
        std::lock_guard<std::mutex> guard(mutex_);
        if (writer_active_ || active_readers_ > 0) {
            return false;
        }
        writer_active_ = true;
        return true;
    }

    void unlock() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            writer_active_ = false;
        }
        // Writers first; readers wake once no writer is queued
        writer_cv_.notify_one();
        reader_cv_.notify_all();
    }

    // Shared ownership

    void lock_shared() {
        std::unique_lock<std::mutex> guard(mutex_);
        reader_cv_.wait(guard, [this] { return !writer_active_ && waiting_writers_ == 0; });
        ++active_readers_;
    }

    bool try_lock_shared() {
        std::lock_guard<std::mutex> guard(mutex_);
        if (writer_active_ || waiting_writers_ > 0) {
            return false;
        }
        ++active_readers_;
        return true;
    }

    void unlock_shared() {
        bool wake_writer = false;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            --active_readers_;
            wake_writer = (active_readers_ == 0 && waiting_writers_ > 0);
        }
        if (wake_writer) {
            writer_cv_.notify_one();
        }
    }

    /// Writers currently blocked in lock()
    size_t WaitingWriters() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return waiting_writers_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable reader_cv_;
    std::condition_variable writer_cv_;
    size_t active_readers_{0};
    size_t waiting_writers_{0};
    bool writer_active_{false};
};

} // namespace dpcm
