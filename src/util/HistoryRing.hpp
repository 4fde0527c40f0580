/**
 * @file HistoryRing.hpp
 * @brief Fixed-capacity FIFO ring buffer
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <vector>

namespace util {

/**
 * @class HistoryRing
 * @brief Keeps the most recent `capacity` items; the oldest is evicted on overflow
 *
 * Iteration order is oldest first. Not synchronized; owners guard it.
 */
template <typename T>
class HistoryRing {
public:
    explicit HistoryRing(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    void push(T value) {
        if (items_.size() == capacity_) {
            items_.pop_front();
        }
        items_.push_back(std::move(value));
    }

    [[nodiscard]] auto size() const -> size_t { return items_.size(); }
    [[nodiscard]] auto capacity() const -> size_t { return capacity_; }
    [[nodiscard]] auto empty() const -> bool { return items_.empty(); }

    [[nodiscard]] auto back() const -> const T& { return items_.back(); }
    [[nodiscard]] auto front() const -> const T& { return items_.front(); }

    [[nodiscard]] auto begin() const { return items_.begin(); }
    [[nodiscard]] auto end() const { return items_.end(); }

    [[nodiscard]] auto to_vector() const -> std::vector<T> {
        return {items_.begin(), items_.end()};
    }

    /**
     * @brief The newest n items, oldest first
     */
    [[nodiscard]] auto last_n(size_t n) const -> std::vector<T> {
        n = std::min(n, items_.size());
        return {items_.end() - static_cast<std::ptrdiff_t>(n), items_.end()};
    }

    void clear() { items_.clear(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

}  // namespace util
