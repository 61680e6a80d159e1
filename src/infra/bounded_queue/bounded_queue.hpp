#pragma once

#include <cstddef>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <stop_token>
#include <optional>
#include <stdexcept>

namespace rcopy::infra {

/// FIFO queue with a fixed capacity, used between pipeline stages.
///
/// push() blocks while the queue is full, pop() while it is empty. Both give up
/// once the stop token is triggered. close() marks the end of input: pop() then
/// drains what is left and returns nullopt, push() is rejected.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // false, если очередь закрыта или запрошена остановка
    [[nodiscard]] bool push(T item, std::stop_token st) {
        {
            std::unique_lock lock(mutex_);
            bool ready = not_full_.wait(lock, st, [this] {
                return closed_ || items_.size() < capacity_;
            });
            if (!ready || closed_ || st.stop_requested()) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // nullopt: очередь закрыта и пуста, либо запрошена остановка
    [[nodiscard]] std::optional<T> pop(std::stop_token st) {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            bool ready = not_empty_.wait(lock, st, [this] {
                return closed_ || !items_.empty();
            });
            if (!ready || st.stop_requested() || items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    bool closed_ = false;
};

} // namespace rcopy::infra
