// lock_free_queue.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

// Single-producer / single-consumer ring buffer
template<typename T>
class LockFreeQueue {
private:
    std::vector<T> buffer_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    const size_t capacity_;

public:
    explicit LockFreeQueue(size_t capacity)
        : buffer_(capacity + 1), capacity_(capacity + 1) {}

    bool push(T item) {
        size_t current_tail = tail_.load(std::memory_order_relaxed);
        size_t next_tail = (current_tail + 1) % capacity_;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            // Queue is full
            return false;
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    bool pop(T& item) {
        size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            // Queue is empty
            return false;
        }

        item = std::move(buffer_[current_head]);
        buffer_[current_head] = T();  // release what the slot held
        head_.store((current_head + 1) % capacity_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) ==
               tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        size_t h = head_.load(std::memory_order_acquire);
        size_t t = tail_.load(std::memory_order_acquire);
        return (t >= h) ? (t - h) : (capacity_ - h + t);
    }

    size_t capacity() const { return capacity_ - 1; }
};
