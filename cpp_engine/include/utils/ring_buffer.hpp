#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tollgate::utils {

/**
 * Bounded FIFO over a fixed vector. When full, the oldest entry is overwritten
 * and counted as dropped so a slow consumer never stalls the producer.
 */
template <typename T>
class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity = 1024) : capacity_(capacity), data_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("RingBuffer requires a positive capacity");
        }
    }

    void push(const T &value) {
        if (size_ == capacity_) {
            head_ = increment(head_);
            --size_;
            ++dropped_;
        }
        data_[(head_ + size_) % capacity_] = value;
        ++size_;
    }

    std::optional<T> pop() {
        if (size_ == 0) {
            return std::nullopt;
        }
        T value = data_[head_];
        head_ = increment(head_);
        --size_;
        return value;
    }

    bool empty() const { return size_ == 0; }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const { return dropped_; }

  private:
    std::size_t increment(std::size_t idx) const { return (idx + 1) % capacity_; }

    const std::size_t capacity_;
    std::vector<T> data_;
    std::size_t head_{0};
    std::size_t size_{0};
    std::size_t dropped_{0};
};

}  // namespace tollgate::utils
