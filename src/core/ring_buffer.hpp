/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity ring buffer with a write cursor.
 * @author Dimitris Kafetzis
 *
 * Backs every bounded history in the project (monitor samples, finished
 * tasks, adaptation outcomes). Not thread-safe; owners guard it with
 * their own mutex.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace adaptive_scheduler {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
        slots_.reserve(capacity_);
    }

    /// Append, overwriting the oldest element once full.
    void push(T value) {
        if (slots_.size() < capacity_) {
            slots_.push_back(std::move(value));
        } else {
            slots_[head_] = std::move(value);
        }
        head_ = (head_ + 1) % capacity_;
    }

    /// Element @p i in chronological order (0 = oldest).
    [[nodiscard]] const T& at(size_t i) const {
        if (i >= slots_.size()) throw std::out_of_range("RingBuffer index out of range");
        return slots_[(start() + i) % slots_.size()];
    }

    [[nodiscard]] const T& back() const { return at(slots_.size() - 1); }

    /// Copy of the contents, oldest first.
    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(slots_.size());
        for (size_t i = 0; i < slots_.size(); ++i) out.push_back(at(i));
        return out;
    }

    /// The most recent @p n elements, oldest first.
    [[nodiscard]] std::vector<T> last(size_t n) const {
        if (n > slots_.size()) n = slots_.size();
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = slots_.size() - n; i < slots_.size(); ++i) out.push_back(at(i));
        return out;
    }

    void clear() noexcept {
        slots_.clear();
        head_ = 0;
    }

    [[nodiscard]] size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }
    [[nodiscard]] bool full() const noexcept { return slots_.size() == capacity_; }

private:
    [[nodiscard]] size_t start() const noexcept {
        return slots_.size() < capacity_ ? 0 : head_;
    }

    size_t capacity_;
    std::vector<T> slots_;
    size_t head_{0};
};

}  // namespace adaptive_scheduler
