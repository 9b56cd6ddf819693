#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace TiltStabilizer {

/**
 * @brief Single-slot, latest-value mailbox between one producer and one or more
 * consumers running on different threads.
 *
 * Every publish overwrites the slot and bumps a sequence number. Consumers keep
 * the last sequence number they saw and use tryReadNew() to fetch a value only
 * when something newer has arrived. Older values are never queued: a slow
 * consumer simply sees the most recent one, which is what both the orientation
 * sensor and the frame source want.
 */
template <typename T>
class SampleMailbox {
public:
    SampleMailbox() : sequence_(0) {}

    void publish(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = value;
        sequence_.fetch_add(1, std::memory_order_release);
    }

    void publish(T&& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::move(value);
        sequence_.fetch_add(1, std::memory_order_release);
    }

    /**
     * @brief Copies the slot into out if it changed since last_seen.
     * @param out Receives the latest value when the result is true
     * @param last_seen In: last sequence consumed. Out: sequence of the value read.
     * @return true if a newer value was read, false if nothing new was published
     */
    bool tryReadNew(T& out, uint32_t& last_seen) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint32_t seq = sequence_.load(std::memory_order_acquire);
        if (seq == last_seen) {
            return false;
        }
        out = data_;
        last_seen = seq;
        return true;
    }

    T readLatest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_;
    }

    bool hasNew(uint32_t last_seen) const {
        return sequence_.load(std::memory_order_acquire) != last_seen;
    }

    uint32_t sequence() const {
        return sequence_.load(std::memory_order_acquire);
    }

private:
    std::atomic<uint32_t> sequence_;
    mutable std::mutex mutex_;
    T data_{};
};

} // namespace TiltStabilizer
