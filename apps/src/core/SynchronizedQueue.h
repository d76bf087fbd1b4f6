#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace ArcticLink {

// Mutex-guarded FIFO. Producers on any thread, one consumer draining with tryPop().
template <typename T>
class SynchronizedQueue {
public:
    void push(T item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
};

} // namespace ArcticLink
