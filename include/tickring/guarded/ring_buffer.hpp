#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "tickring/error.hpp"
#include "tickring/log/logger.hpp"
#include "tickring/memory/footprint.hpp"


namespace tickring {
namespace guarded {

//------------------------------------------------------------------------------
// Mutex-guarded bounded ring buffer.
//
// Same logical surface as lockfree::ring_buffer, but every operation holds one
// std::mutex for its whole duration. All operations are linearizable and any
// positive capacity is accepted (indices wrap with modulo, not a mask).
//
// Prefer it over the lock-free ring when contention is low or when consistent
// multi-item views (values(), last()) are needed.
//
// Example:
//   std::unique_ptr<ring_buffer<std::string>> lines;
//   if (ring_buffer<std::string>::create(100, lines) == Error::None) {
//       (void)lines->push("hello");
//       auto tail = lines->last(10);
//   }
//------------------------------------------------------------------------------
template <typename T>
class ring_buffer {
public:
    using value_type = T;

    [[nodiscard]] static Error create(std::uint64_t capacity, std::unique_ptr<ring_buffer>& out) {
        if (capacity == 0) {
            TR_WARN("[GUARDED] Rejected capacity 0");
            return Error::InvalidCapacity;
        }
        out = std::make_unique<ring_buffer>(construct_tag{}, capacity);
        return Error::None;
    }

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    [[nodiscard]] Error push(const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == capacity_) {
            return Error::Full;
        }
        buffer_[tail_] = item;
        advance_tail_();
        return Error::None;
    }

    [[nodiscard]] Error push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == capacity_) {
            return Error::Full;
        }
        buffer_[tail_] = std::move(item);
        advance_tail_();
        return Error::None;
    }

    [[nodiscard]] Error pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return Error::Empty;
        }
        out = std::move(buffer_[head_]);
        buffer_[head_] = T{};
        head_ = (head_ + 1) % capacity_;
        --size_;
        return Error::None;
    }

    // Oldest item, left in place
    [[nodiscard]] Error peek(T& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return Error::Empty;
        }
        out = buffer_[head_];
        return Error::None;
    }

    // All items, oldest to newest
    [[nodiscard]] std::vector<T> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(size_);
        for (std::uint64_t i = 0; i < size_; ++i) {
            result.push_back(buffer_[(head_ + i) % capacity_]);
        }
        return result;
    }

    // The newest min(n, size) items, oldest first
    [[nodiscard]] std::vector<T> last(std::uint64_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        n = std::min(n, size_);
        std::vector<T> result;
        result.reserve(n);
        for (std::uint64_t i = 0; i < n; ++i) {
            result.push_back(buffer_[(tail_ + capacity_ - n + i) % capacity_]);
        }
        return result;
    }

    [[nodiscard]] std::uint64_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] inline std::uint64_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == 0;
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == capacity_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::fill(buffer_.begin(), buffer_.end(), T{});
        size_ = 0;
        head_ = 0;
        tail_ = 0;
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        return memory::footprint{
            .static_bytes = sizeof(ring_buffer),
            .dynamic_bytes = capacity_ * sizeof(T)
        };
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    ring_buffer(construct_tag, std::uint64_t capacity)
        : capacity_(capacity)
        , buffer_(capacity)
    {}

private:
    inline void advance_tail_() noexcept {
        tail_ = (tail_ + 1) % capacity_;
        ++size_;
    }

    const std::uint64_t capacity_;
    std::vector<T> buffer_;
    std::uint64_t size_{0};
    std::uint64_t head_{0};
    std::uint64_t tail_{0};
    mutable std::mutex mutex_;
};

} // namespace guarded
} // namespace tickring
