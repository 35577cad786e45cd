#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace Commpute {

/**
 * @brief Fixed arena of private segment buffers handed out one task at a time.
 *
 * acquire() blocks while every buffer is checked out (backpressure on the
 * writer). A Lease returns its buffer when destroyed, on every exit path of
 * the task holding it.
 */
class SegmentBufferPool {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept : pool_(other.pool_), index_(other.index_) {
            other.pool_ = nullptr;
        }
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                index_ = other.index_;
                other.pool_ = nullptr;
            }
            return *this;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { release(); }

        uint8_t* data() { return pool_->buffers_[index_].data(); }
        const uint8_t* data() const { return pool_->buffers_[index_].data(); }
        size_t size() const { return pool_->buffer_size_; }
        size_t index() const { return index_; }
        bool valid() const { return pool_ != nullptr; }

        void release() {
            if (pool_) {
                pool_->give_back(index_);
                pool_ = nullptr;
            }
        }

    private:
        friend class SegmentBufferPool;
        Lease(SegmentBufferPool* pool, size_t index) : pool_(pool), index_(index) {}

        SegmentBufferPool* pool_ = nullptr;
        size_t index_ = 0;
    };

    SegmentBufferPool(size_t slots, size_t buffer_size)
        : buffer_size_(buffer_size) {
        if (slots == 0) {
            throw std::invalid_argument("SegmentBufferPool: at least one slot is required");
        }
        buffers_.reserve(slots);
        free_.reserve(slots);
        for (size_t i = 0; i < slots; ++i) {
            buffers_.emplace_back(buffer_size);
            free_.push_back(slots - 1 - i);
        }
    }

    SegmentBufferPool(const SegmentBufferPool&) = delete;
    SegmentBufferPool& operator=(const SegmentBufferPool&) = delete;

    /**
     * @brief Check out a free buffer, blocking until one is returned.
     */
    Lease acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !free_.empty(); });
        size_t index = free_.back();
        free_.pop_back();
        return Lease(this, index);
    }

    size_t capacity() const { return buffers_.size(); }
    size_t buffer_size() const { return buffer_size_; }

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return free_.size();
    }

    /**
     * @brief Block until every buffer is back in the pool.
     */
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return free_.size() == buffers_.size(); });
    }

private:
    void give_back(size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            free_.push_back(index);
        }
        cv_.notify_all();
    }

    size_t buffer_size_;
    std::vector<std::vector<uint8_t>> buffers_;
    std::vector<size_t> free_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace Commpute
