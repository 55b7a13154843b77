#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity SPSC lock-free queue feeding the Logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <vector>

namespace bangbang {
  namespace core {

    /**
 * @class RingBuffer
 * @brief One producer thread pushes, one consumer thread pops.
 *
 *  * Storage allocated once in the ctor; push/pop never allocate or block.
 *  * A push onto a full ring is dropped and counted.
 */
    template <typename T> class RingBuffer {
      static_assert(std::is_trivially_copyable_v<T>, "RingBuffer slots are copied by value");

    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity + 1) {}

      RingBuffer(const RingBuffer&) = delete;
      RingBuffer& operator=(const RingBuffer&) = delete;

      /// Producer side. @returns false (and counts a drop) if full.
      bool tryPush(const T& value) noexcept {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = advance(head);
        if (next == tail_.load(std::memory_order_acquire)) {
          dropped_.fetch_add(1, std::memory_order_relaxed);
          return false;
        }
        slots_[head] = value;
        head_.store(next, std::memory_order_release);
        return true;
      }

      /// Consumer side.
      std::optional<T> tryPop() noexcept {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
          return std::nullopt;
        T value = slots_[tail];
        tail_.store(advance(tail), std::memory_order_release);
        return value;
      }

      bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
      }

      std::size_t capacity() const noexcept { return slots_.size() - 1; }
      std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    private:
      std::size_t advance(std::size_t i) const noexcept { return (i + 1) % slots_.size(); }

      std::vector<T> slots_;                ///< one slot kept empty to tell full from empty
      std::atomic<std::size_t> head_{ 0 };  ///< next write
      std::atomic<std::size_t> tail_{ 0 };  ///< next read
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace bangbang
