#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tickring/error.hpp"
#include "tickring/log/logger.hpp"
#include "tickring/memory/footprint.hpp"


namespace tickring {
namespace window {

//------------------------------------------------------------------------------
// Fixed-capacity rolling window.
//
// Keeps the most recent `capacity` samples. add() never fails: once the
// window is full each new sample overwrites the oldest one.
//
// Views linearize the circular storage starting at the oldest sample, so
// position 0 is always the oldest retained sample and size() - 1 the newest.
//
// Thread-safety:
//   - NOT thread-safe. Owned and used by a single thread (or guarded by the
//     owner's own lock).
//   - For cross-thread hand-off use lockfree::ring_buffer or
//     guarded::ring_buffer.
//
// Example:
//   std::unique_ptr<string_buffer> warnings;
//   (void)string_buffer::create(100, warnings);
//   warnings->add("WARN: disk almost full");
//   for (const auto& line : warnings->last(10)) { ... }
//------------------------------------------------------------------------------
template <typename T>
class rolling_buffer {
public:
    using value_type = T;

    [[nodiscard]] static Error create(std::uint64_t capacity, std::unique_ptr<rolling_buffer>& out) {
        if (capacity == 0) {
            TR_WARN("[WINDOW] Rejected capacity 0");
            return Error::InvalidCapacity;
        }
        out = std::make_unique<rolling_buffer>(construct_tag{}, capacity);
        return Error::None;
    }

    rolling_buffer(const rolling_buffer&) = delete;
    rolling_buffer& operator=(const rolling_buffer&) = delete;

    void add(const T& sample) {
        slot_for_next_() = sample;
    }

    void add(T&& sample) {
        slot_for_next_() = std::move(sample);
    }

    // Every retained sample, oldest first
    [[nodiscard]] std::vector<T> values() const {
        return collect_(0, size_);
    }

    // The newest min(n, size) samples, oldest first
    [[nodiscard]] std::vector<T> last(std::uint64_t n) const {
        n = std::min(n, size_);
        return collect_(size_ - n, size_);
    }

    // Half-open [begin, end), end clamped to size
    [[nodiscard]] std::vector<T> slice(std::uint64_t begin, std::uint64_t end) const {
        return collect_(begin, std::min(end, size_));
    }

    // Closed [first, last], last clamped to the newest sample
    [[nodiscard]] std::vector<T> position(std::uint64_t first, std::uint64_t last) const {
        if (first > last || first >= size_) {
            return {};
        }
        return collect_(first, std::min(last, size_ - 1) + 1);
    }

    [[nodiscard]] inline std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] inline std::uint64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] inline bool full() const noexcept { return size_ == capacity_; }

    void reset() {
        std::fill(buffer_.begin(), buffer_.end(), T{});
        head_ = 0;
        size_ = 0;
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        return memory::footprint{
            .static_bytes = sizeof(rolling_buffer),
            .dynamic_bytes = capacity_ * sizeof(T)
        };
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    rolling_buffer(construct_tag, std::uint64_t capacity)
        : capacity_(capacity)
        , buffer_(capacity)
    {}

private:
    // Slot that receives the next sample; evicts the oldest when full
    T& slot_for_next_() noexcept {
        if (size_ < capacity_) {
            return buffer_[(head_ + size_++) % capacity_];
        }
        T& slot = buffer_[head_];
        head_ = (head_ + 1) % capacity_;
        return slot;
    }

    std::vector<T> collect_(std::uint64_t begin, std::uint64_t end) const {
        std::vector<T> result;
        if (begin >= end) {
            return result;
        }
        result.reserve(end - begin);
        for (std::uint64_t i = begin; i < end; ++i) {
            result.push_back(buffer_[(head_ + i) % capacity_]);
        }
        return result;
    }

    const std::uint64_t capacity_;
    std::vector<T> buffer_;
    std::uint64_t head_{0};
    std::uint64_t size_{0};
};

// Textual log lines
using string_buffer = rolling_buffer<std::string>;

// Numeric samples
using float64_buffer = rolling_buffer<double>;

} // namespace window
} // namespace tickring
