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
#ifndef __VDIFRX_IO_UDP_REORDER_BUFFER__
#define __VDIFRX_IO_UDP_REORDER_BUFFER__

#include <algorithm>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/udp/udp_common.hpp"
#include "vdifrx/io/vdif_frame.hpp"

namespace vdifrx {
namespace io {
namespace udp {

/** @brief ordering key of frames in one thread */
struct sequence_key {
  uint32_t seconds_since_epoch = 0;
  uint32_t frame_number = 0;

  static auto of(const vdif_header& header) noexcept -> sequence_key {
    return sequence_key{header.seconds_since_epoch(), header.frame_number()};
  }

  auto operator<=>(const sequence_key& other) const = default;
};

struct reorder_config {
  /**
   * @brief frames at most this many keys after the last emitted one are held,
   *        and at most this many frames are held per thread;
   *        as the successor itself is never held, a full window of distinct
   *        keys needs a capacity of (max gap to bridge + 1).
   */
  size_t window_capacity = 64;
  /** @brief max time a frame may be held */
  std::chrono::nanoseconds max_wait = std::chrono::milliseconds{100};
  /** @brief frames per second of each thread, 0 to learn from stream */
  uint32_t frames_per_second = 0;
  /** @brief drop late / duplicated frames instead of passing them through */
  bool drop_stale = false;
};

/**
 * @brief Restores order of frames of each thread_id within a bounded window.
 * 
 * Frames are emitted through a callback @c emit(vdif_frame&) ; the callback may
 * exchange content of the frame (e.g. to recycle storage from a ring buffer).
 * 
 * For each thread the last emitted key is remembered; an incoming frame is
 *   - emitted, if it is the successor of last emitted key, followed by
 *     held frames that became successors;
 *   - held, if it is at most @c window_capacity keys ahead;
 *   - emitted after all held frames, if it is further ahead;
 *   - passed through (or dropped if @c drop_stale ), if it is at or behind
 *     the last emitted key, as it cannot be put in order any more;
 *   - taken as start of a new stream, if it is far behind the last emitted
 *     key or its reference epoch changed (e.g. sender restarted): held frames
 *     are flushed and the thread is tracked from this frame on.
 * Held frames are also flushed when the window is full, or when one of them
 * waited longer than @c max_wait .
 * 
 * If frames per second is learned, a frame of next second is not taken as
 * successor until a whole second has been seen, as max frame number seen
 * may still be too small.
 * 
 * Not thread safe: owned by the receiving thread.
 */
class reorder_buffer {
 public:
  using clock_type = std::chrono::steady_clock;
  using time_point = clock_type::time_point;

 protected:
  struct held_frame {
    sequence_key key;
    uint64_t transport_sequence;
    time_point arrival_time;
    vdif_frame frame;
  };

  struct thread_state {
    bool has_emitted = false;
    sequence_key last_emitted;
    uint32_t reference_epoch = 0;
    /** @brief max frame number seen + 1 */
    uint64_t learned_frames_per_second = 0;
    /** @brief second of first frame since (re)start */
    uint32_t first_second = 0;
    /** @brief a whole second has passed, so learned value is final */
    bool frames_per_second_known = false;
    /** @brief held frames, sorted by key then transport sequence */
    std::vector<held_frame> window;
  };

  reorder_config config;
  receiver_statistics& statistics;
  std::unordered_map<uint32_t, thread_state> threads;
  /** @brief frame storage recycled from emitted held frames */
  std::vector<vdif_frame> spare_frames;

  auto frames_per_second(const thread_state& state) const -> uint64_t {
    if (config.frames_per_second > 0) {
      return config.frames_per_second;
    }
    return std::max(state.learned_frames_per_second, uint64_t{1});
  }

  auto frames_per_second_known(const thread_state& state) const -> bool {
    return config.frames_per_second > 0 || state.frames_per_second_known;
  }

  /** @brief how far behind last emitted key a frame starts a new stream */
  auto resync_distance(const thread_state& state) const -> int64_t {
    return static_cast<int64_t>(
        std::max(uint64_t{config.window_capacity}, frames_per_second(state)));
  }

  /** @brief how many keys @c to is after @c from , negative if before */
  auto distance(const thread_state& state, const sequence_key& from,
                const sequence_key& to) const -> int64_t {
    const int64_t fps = static_cast<int64_t>(frames_per_second(state));
    return (static_cast<int64_t>(to.seconds_since_epoch) -
            static_cast<int64_t>(from.seconds_since_epoch)) *
               fps +
           (static_cast<int64_t>(to.frame_number) -
            static_cast<int64_t>(from.frame_number));
  }

  auto take_spare_frame() -> vdif_frame {
    if (spare_frames.empty()) {
      return vdif_frame{};
    }
    vdif_frame frame = std::move(spare_frames.back());
    spare_frames.pop_back();
    return frame;
  }

  /** @brief @c to (being @c d keys after @c from ) directly follows @c from */
  auto is_successor(const thread_state& state, const sequence_key& from,
                    const sequence_key& to, int64_t d) const -> bool {
    return d == 1 && (from.seconds_since_epoch == to.seconds_since_epoch ||
                      frames_per_second_known(state));
  }

  /** @brief emit a frame that advances the sequence, counting skipped keys as lost */
  template <typename Emit>
  void emit_in_order(thread_state& state, const sequence_key& key,
                     vdif_frame& frame, Emit& emit) {
    if (state.has_emitted) {
      const int64_t d = distance(state, state.last_emitted, key);
      if (d > 1) {
        receiver_statistics::increase(statistics.sequence_gaps);
        receiver_statistics::increase(statistics.frames_lost,
                                      static_cast<uint64_t>(d - 1));
      }
    }
    emit(frame);
    state.last_emitted = key;
    state.has_emitted = true;
  }

  /** @brief emit held frame at front of window */
  template <typename Emit>
  void emit_front(thread_state& state, Emit& emit) {
    held_frame& front = state.window.front();
    if (state.has_emitted && distance(state, state.last_emitted, front.key) <= 0) {
      // duplicate of a frame emitted just now
      emit(front.frame);
    } else {
      emit_in_order(state, front.key, front.frame, emit);
    }
    spare_frames.push_back(std::move(front.frame));
    state.window.erase(state.window.begin());
  }

  /** @brief emit held frames that directly follow last emitted key */
  template <typename Emit>
  void drain_successors(thread_state& state, Emit& emit) {
    while (!state.window.empty()) {
      const sequence_key& next = state.window.front().key;
      const int64_t d = distance(state, state.last_emitted, next);
      if (d > 0 && !is_successor(state, state.last_emitted, next, d)) {
        break;
      }
      emit_front(state, emit);
    }
  }

  /** @brief forget sequence of a thread, flushing its held frames */
  template <typename Emit>
  void resync(thread_state& state, const vdif_header& header, Emit& emit) {
    receiver_statistics::increase(statistics.resyncs);
    VDIFRX_LOGI << " [reorder_buffer] "
                << "thread " << header.thread_id() << " restarted at "
                << "reference_epoch = " << header.reference_epoch()
                << ", seconds_since_epoch = " << header.seconds_since_epoch()
                << ", frame_number = " << header.frame_number()
                << ", last emitted: reference_epoch = "
                << state.reference_epoch << ", seconds_since_epoch = "
                << state.last_emitted.seconds_since_epoch
                << ", frame_number = " << state.last_emitted.frame_number
                << vdifrx::endl;
    while (!state.window.empty()) {
      emit_front(state, emit);
    }
    state.has_emitted = false;
    state.learned_frames_per_second = 0;
    state.frames_per_second_known = false;
  }

  /** @brief emit held frames with key less than @c key */
  template <typename Emit>
  void flush_below(thread_state& state, const sequence_key& key, Emit& emit) {
    while (!state.window.empty() && state.window.front().key < key) {
      emit_front(state, emit);
    }
  }

  void hold(thread_state& state, const sequence_key& key,
            uint64_t transport_sequence, time_point now, vdif_frame& frame) {
    auto position = std::upper_bound(
        state.window.begin(), state.window.end(),
        std::make_pair(key, transport_sequence),
        [](const std::pair<sequence_key, uint64_t>& value,
           const held_frame& element) {
          return value <
                 std::make_pair(element.key, element.transport_sequence);
        });
    state.window.insert(position, held_frame{.key = key,
                                             .transport_sequence =
                                                 transport_sequence,
                                             .arrival_time = now,
                                             .frame = std::move(frame)});
    frame = take_spare_frame();
  }

  auto is_held(const thread_state& state, const sequence_key& key) const
      -> bool {
    return std::any_of(state.window.begin(), state.window.end(),
                       [&](const held_frame& h) { return h.key == key; });
  }

 public:
  reorder_buffer(const reorder_config& config_,
                 receiver_statistics& statistics_)
      : config{config_}, statistics{statistics_} {}

  /**
   * @brief accept a frame just received.
   * @param frame content is taken; on return it holds storage to be reused
   *              for next frame (content unspecified)
   * @param transport_sequence breaks ties of equal keys, 0 if none
   */
  template <typename Emit>
  void push(vdif_frame& frame, uint64_t transport_sequence, time_point now,
            Emit&& emit) {
    const vdif_header& header = frame.header();
    const sequence_key key = sequence_key::of(header);
    thread_state& state = threads[header.thread_id()];

    if (state.has_emitted &&
        (header.reference_epoch() != state.reference_epoch ||
         distance(state, state.last_emitted, key) < -resync_distance(state)))
        [[unlikely]] {
      resync(state, header, emit);
    }

    state.learned_frames_per_second =
        std::max(state.learned_frames_per_second,
                 uint64_t{header.frame_number()} + 1);

    if (!state.has_emitted) [[unlikely]] {
      state.reference_epoch = header.reference_epoch();
      state.first_second = key.seconds_since_epoch;
      emit_in_order(state, key, frame, emit);
      return;
    }

    if (!state.frames_per_second_known &&
        uint64_t{key.seconds_since_epoch} >= uint64_t{state.first_second} + 2)
        [[unlikely]] {
      // frames of a whole second have been seen
      state.frames_per_second_known = true;
      drain_successors(state, emit);
    }

    const int64_t d = distance(state, state.last_emitted, key);
    if (d <= 0) [[unlikely]] {
      // late or duplicated; window has moved on
      if (d == 0) {
        receiver_statistics::increase(statistics.duplicate_frames);
      } else {
        receiver_statistics::increase(statistics.late_frames);
      }
      if (config.drop_stale) {
        receiver_statistics::increase(statistics.stale_frames_dropped);
      } else {
        emit(frame);
      }
      return;
    }

    if (is_successor(state, state.last_emitted, key, d)) [[likely]] {
      emit_in_order(state, key, frame, emit);
      drain_successors(state, emit);
      return;
    }

    if (static_cast<uint64_t>(d) <= config.window_capacity) {
      if (is_held(state, key)) [[unlikely]] {
        receiver_statistics::increase(statistics.duplicate_frames);
        if (config.drop_stale) {
          receiver_statistics::increase(statistics.stale_frames_dropped);
          return;
        }
      }
      hold(state, key, transport_sequence, now, frame);
      if (state.window.size() > config.window_capacity) {
        // oldest held frame gives up waiting for its predecessor
        receiver_statistics::increase(statistics.forced_flushes);
        emit_front(state, emit);
        drain_successors(state, emit);
      }
      return;
    }

    // too far ahead to be held: give up on everything before it
    receiver_statistics::increase(statistics.forced_flushes);
    flush_below(state, key, emit);
    emit_in_order(state, key, frame, emit);
    drain_successors(state, emit);
  }

  /**
   * @brief flush frames held longer than max wait, together with all held
   *        frames before them, as their predecessors are deemed lost.
   */
  template <typename Emit>
  void poll(time_point now, Emit&& emit) {
    for (auto& [thread_id, state] : threads) {
      if (state.window.empty()) {
        continue;
      }
      // window is sorted by key, not by arrival time
      size_t last_expired = state.window.size();
      for (size_t i = 0; i < state.window.size(); i++) {
        if (now - state.window[i].arrival_time >= config.max_wait) {
          last_expired = i;
        }
      }
      if (last_expired == state.window.size()) {
        continue;
      }
      receiver_statistics::increase(statistics.timed_flushes);
      const sequence_key key = state.window[last_expired].key;
      while (!state.window.empty() && state.window.front().key <= key) {
        emit_front(state, emit);
      }
      drain_successors(state, emit);
    }
  }

  /** @brief emit all held frames in key order, e.g. on shutdown */
  template <typename Emit>
  void flush_all(Emit&& emit) {
    for (auto& [thread_id, state] : threads) {
      while (!state.window.empty()) {
        emit_front(state, emit);
      }
    }
  }

  /** @brief count of frames held in all threads */
  auto held_count() const -> size_t {
    size_t count = 0;
    for (const auto& [thread_id, state] : threads) {
      count += state.window.size();
    }
    return count;
  }

  /** @brief last emitted key of @c thread_id , if any frame of it emitted */
  auto last_emitted(uint32_t thread_id) const -> std::optional<sequence_key> {
    auto it = threads.find(thread_id);
    if (it == threads.end() || !it->second.has_emitted) {
      return std::nullopt;
    }
    return it->second.last_emitted;
  }
};

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  //  __VDIFRX_IO_UDP_REORDER_BUFFER__
