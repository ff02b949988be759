#pragma once
#include <cstddef>
#include <vector>
#include <utility>

namespace core {

// Fixed-capacity history buffer. Appending to a full buffer overwrites the oldest slot.
// Not synchronized: owned by a single context (the playback scheduler's event loop).
template <typename T>
class CircularBuffer {
public:
    explicit CircularBuffer(size_t capacity = 10)
        : buffer_(capacity == 0 ? 1 : capacity), capacity_(capacity == 0 ? 1 : capacity) {}

    size_t capacity() const { return capacity_; }
    size_t size() const { return count_; }
    bool is_empty() const { return count_ == 0; }
    bool is_full() const { return count_ == capacity_; }

    void append(T item) {
        size_t slot = (head_ + count_) % capacity_;
        buffer_[slot] = std::move(item);
        if (count_ < capacity_) {
            ++count_;
        } else {
            // Full: the write landed on the oldest element, move head past it
            head_ = (head_ + 1) % capacity_;
        }
    }

    // Oldest to newest.
    std::vector<T> elements() const {
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out.push_back(buffer_[(head_ + i) % capacity_]);
        }
        return out;
    }

    // Newest to oldest.
    std::vector<T> reversed() const {
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = count_; i > 0; --i) {
            out.push_back(buffer_[(head_ + i - 1) % capacity_]);
        }
        return out;
    }

    void clear() {
        for (auto& slot : buffer_) slot = T{};
        head_ = 0;
        count_ = 0;
    }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    size_t head_ = 0;   // index of the oldest element
    size_t count_ = 0;
};

} // namespace core
