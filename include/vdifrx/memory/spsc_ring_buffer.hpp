/******************************************************************************* 
 * Copyright (c) 2025 fxzjshm
 * This software is licensed under Mulan PubL v2.
 * You can use this software according to the terms and conditions of the Mulan PubL v2.
 * You may obtain a copy of Mulan PubL v2 at:
 *          http://license.coscl.org.cn/MulanPubL-2.0
 * THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
 * EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
 * MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
 * See the Mulan PubL v2 for more details.
 ******************************************************************************/

#pragma once
#ifndef __VDIFRX_MEMORY_SPSC_RING_BUFFER__
#define __VDIFRX_MEMORY_SPSC_RING_BUFFER__

#include <algorithm>
#include <atomic>
#include <bit>
#include <chrono>
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

#include "vdifrx/config.hpp"

namespace vdifrx {
namespace memory {

enum class pop_status { ok, timeout, closed };

/**
 * @brief wait-free single producer single consumer queue of fixed capacity.
 * 
 * Slots are allocated once at construction and reused: elements are
 * exchanged with slots, so that storage of a popped element (e.g. payload
 * buffer of a frame) can be handed back to the producer without allocation.
 * 
 * @c tail is only written by producer, @c head only by consumer; both
 * grow monotonically and are published with release, observed with acquire.
 * Each side keeps a private copy of the other's index, re-read only when
 * the queue looks full / empty.
 */
template <typename T>
class spsc_ring_buffer {
 protected:
  std::vector<T> slots;
  size_t mask;

  // producer side
  alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail = 0;
  size_t cached_head = 0;

  // consumer side
  alignas(CACHE_LINE_SIZE) std::atomic<size_t> head = 0;
  size_t cached_tail = 0;

  alignas(CACHE_LINE_SIZE) std::atomic<bool> is_closed = false;

  auto wait_for_slot() -> bool {
    const size_t t = tail.load(std::memory_order_relaxed);
    if (t - cached_head == slots.size()) {
      cached_head = head.load(std::memory_order_acquire);
      if (t - cached_head == slots.size()) {
        return false;
      }
    }
    return true;
  }

  auto wait_for_item() -> bool {
    const size_t h = head.load(std::memory_order_relaxed);
    if (h == cached_tail) {
      cached_tail = tail.load(std::memory_order_acquire);
      if (h == cached_tail) {
        return false;
      }
    }
    return true;
  }

 public:
  /** @param capacity rounded up to power of 2, at least 1 */
  explicit spsc_ring_buffer(size_t capacity)
      : slots(std::bit_ceil(std::max(capacity, size_t{1}))),
        mask{slots.size() - 1} {}

  spsc_ring_buffer(const spsc_ring_buffer&) = delete;
  spsc_ring_buffer& operator=(const spsc_ring_buffer&) = delete;

  auto capacity() const noexcept -> size_t { return slots.size(); }

  /**
   * @brief producer: move @c item into the queue
   * @return false if full, @c item is untouched then
   */
  [[nodiscard]] auto try_push(T&& item) -> bool {
    if (!wait_for_slot()) {
      return false;
    }
    const size_t t = tail.load(std::memory_order_relaxed);
    slots[t & mask] = std::move(item);
    tail.store(t + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief producer: exchange @c item with the next free slot, so @c item
   *        receives storage released by consumer earlier.
   * @return false if full, @c item is untouched then
   */
  [[nodiscard]] auto try_push_exchange(T& item) -> bool {
    if (!wait_for_slot()) {
      return false;
    }
    const size_t t = tail.load(std::memory_order_relaxed);
    using std::swap;
    swap(slots[t & mask], item);
    tail.store(t + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief consumer: exchange oldest element with @c out
   * @return false if empty
   */
  [[nodiscard]] auto try_pop(T& out) -> bool {
    if (!wait_for_item()) {
      return false;
    }
    const size_t h = head.load(std::memory_order_relaxed);
    using std::swap;
    swap(slots[h & mask], out);
    head.store(h + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief consumer: spin, then yield, until an element is available,
   *        @c timeout elapsed, or queue is closed and drained.
   */
  template <typename Rep, typename Period>
  auto blocking_pop(T& out, std::chrono::duration<Rep, Period> timeout)
      -> pop_status {
    constexpr size_t spin_count = 64;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t i = 0;
    while (true) {
      if (try_pop(out)) {
        return pop_status::ok;
      }
      if (closed()) {
        // producer may have pushed right before closing
        return try_pop(out) ? pop_status::ok : pop_status::closed;
      }
      if (i < spin_count) {
        i++;
      } else {
        if (std::chrono::steady_clock::now() >= deadline) {
          return pop_status::timeout;
        }
        std::this_thread::yield();
      }
    }
  }

  /** @brief producer: no more elements will be pushed */
  void close() noexcept { is_closed.store(true, std::memory_order_release); }

  auto closed() const noexcept -> bool {
    return is_closed.load(std::memory_order_acquire);
  }

  /** @brief count of elements, exact only when called by consumer or producer */
  auto read_available() const noexcept -> size_t {
    const size_t h = head.load(std::memory_order_acquire);
    const size_t t = tail.load(std::memory_order_acquire);
    return t - h;
  }

  auto empty() const noexcept -> bool { return read_available() == 0; }
};

}  // namespace memory
}  // namespace vdifrx

#endif  // __VDIFRX_MEMORY_SPSC_RING_BUFFER__
