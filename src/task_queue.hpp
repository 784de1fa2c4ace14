#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace wacast {

// Unbounded multi-producer FIFO. pop_for() waits at most `timeout` so the
// consumer can notice shutdown between tasks.
template<typename T>
class TaskQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    template<typename It>
    void push_all(It first, It last) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (; first != last; ++first) items_.push_back(std::move(*first));
        }
        cv_.notify_one();
    }

    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || woken_; })) {
            return std::nullopt;
        }
        woken_ = false;
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Release a consumer blocked in pop_for() without an item.
    void wake() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool woken_ = false;
};

} // namespace wacast
