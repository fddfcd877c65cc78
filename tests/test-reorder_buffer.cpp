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

#include <chrono>
#include <cstdint>
#include <tuple>
#include <utility>
#include <vector>

#include "vdifrx/commons.hpp"
// -- divide line for clang-format --
#include "test-common.hpp"
#include "vdifrx/io/udp/reorder_buffer.hpp"

#define VDIFRX_CHECK_TEST_REORDER_BUFFER(expr) \
  VDIFRX_CHECK_TEST("[test-reorder_buffer] ", expr)

using vdifrx::io::vdif_frame;
using vdifrx::io::vdif_header;
using vdifrx::io::udp::receiver_statistics;
using vdifrx::io::udp::reorder_buffer;
using vdifrx::io::udp::reorder_config;
using r = receiver_statistics;

/** @brief (thread_id, seconds, frame_number, tag) of an emitted frame */
using emitted_type = std::tuple<uint32_t, uint32_t, uint32_t, unsigned int>;

auto make_frame(uint32_t thread_id, uint32_t seconds, uint32_t frame_number,
                unsigned int tag = 0, uint32_t reference_epoch = 0)
    -> vdif_frame {
  vdif_header header;
  header.set_reference_epoch(reference_epoch)
      .set_seconds_since_epoch(seconds)
      .set_frame_number(frame_number)
      .set_thread_id(thread_id)
      .set_frame_bytes(40)
      .set_bits_per_sample(2);
  std::vector<std::byte> payload(8);
  payload[0] = static_cast<std::byte>(tag);
  return vdif_frame::from_parts(header, std::move(payload));
}

struct reorder_fixture {
  receiver_statistics statistics;
  reorder_buffer buffer;
  std::vector<emitted_type> emitted;
  reorder_buffer::time_point now = reorder_buffer::clock_type::now();

  explicit reorder_fixture(const reorder_config& config)
      : buffer{config, statistics} {}

  auto emitter() {
    return [this](vdif_frame& frame) {
      const auto& h = frame.header();
      emitted.emplace_back(h.thread_id(), h.seconds_since_epoch(),
                           h.frame_number(),
                           std::to_integer<unsigned int>(frame.payload()[0]));
    };
  }

  void push(uint32_t thread_id, uint32_t seconds, uint32_t frame_number,
            unsigned int tag = 0, uint64_t transport_sequence = 0) {
    vdif_frame frame = make_frame(thread_id, seconds, frame_number, tag);
    buffer.push(frame, transport_sequence, now, emitter());
  }

  void push(uint32_t frame_number) { push(0, 0, frame_number); }

  void push_with_epoch(uint32_t reference_epoch, uint32_t seconds,
                       uint32_t frame_number) {
    vdif_frame frame = make_frame(0, seconds, frame_number, 0, reference_epoch);
    buffer.push(frame, 0, now, emitter());
  }

  /** @brief (seconds, frame_number) of emitted frames */
  auto keys() const -> std::vector<std::pair<uint32_t, uint32_t> > {
    std::vector<std::pair<uint32_t, uint32_t> > out;
    for (const auto& e : emitted) {
      out.emplace_back(std::get<1>(e), std::get<2>(e));
    }
    return out;
  }

  auto frame_numbers() const -> std::vector<uint32_t> {
    std::vector<uint32_t> out;
    for (const auto& e : emitted) {
      out.push_back(std::get<2>(e));
    }
    return out;
  }
};

auto make_config(size_t window_capacity, bool drop_stale = false,
                 uint32_t frames_per_second = 0) -> reorder_config {
  reorder_config config;
  config.window_capacity = window_capacity;
  config.max_wait = std::chrono::milliseconds{100};
  config.frames_per_second = frames_per_second;
  config.drop_stale = drop_stale;
  return config;
}

void test_simple_reorder() {
  reorder_fixture f{make_config(8)};
  for (uint32_t n : {1, 3, 2, 4}) {
    f.push(n);
  }
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 2, 3, 4}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.last_emitted(0).has_value());
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.last_emitted(0)->frame_number == 4);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(!f.buffer.last_emitted(1).has_value());
}

void test_far_ahead_and_late() {
  reorder_fixture f{make_config(2)};
  for (uint32_t n : {1, 5, 2, 3, 4}) {
    f.push(n);
  }
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 5, 2, 3, 4}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.forced_flushes) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 3);

  reorder_fixture g{make_config(2, true)};
  for (uint32_t n : {1, 5, 2, 3, 4, 5}) {
    g.push(n);
  }
  VDIFRX_CHECK_TEST_REORDER_BUFFER((g.frame_numbers() == std::vector<uint32_t>{1, 5}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(g.statistics.late_frames) == 3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(g.statistics.duplicate_frames) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(g.statistics.stale_frames_dropped) == 4);
}

void test_window_overflow() {
  reorder_fixture f{make_config(2)};
  f.push(1);
  f.push(3);
  f.push(3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 2);
  // third copy exceeds window, oldest held frame is forced out
  f.push(3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 3, 3, 3}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.duplicate_frames) == 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.forced_flushes) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 1);

  reorder_fixture g{make_config(2, true)};
  g.push(1);
  g.push(3);
  g.push(3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(g.buffer.held_count() == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(g.statistics.stale_frames_dropped) == 1);
}

void test_timed_flush() {
  reorder_fixture f{make_config(8)};
  f.push(1);
  f.push(3);
  f.now += std::chrono::milliseconds{10};
  f.push(5);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 2);

  f.buffer.poll(f.now + std::chrono::milliseconds{50}, f.emitter());
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 1);

  // frame 3 expired, frame 5 not yet
  f.buffer.poll(f.now + std::chrono::milliseconds{95}, f.emitter());
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 3}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.timed_flushes) == 1);

  f.buffer.poll(f.now + std::chrono::milliseconds{100}, f.emitter());
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 3, 5}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.timed_flushes) == 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 2);
}

void test_second_boundary() {
  reorder_fixture f{make_config(8, false, 4)};
  f.push(0, 10, 2);
  f.push(0, 11, 0);
  f.push(0, 10, 3);
  f.push(0, 11, 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 4);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<1>(f.emitted[1]) == 10);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[1]) == 3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<1>(f.emitted[2]) == 11);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[2]) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 0);
}

void test_learned_frames_per_second() {
  reorder_fixture f{make_config(8)};
  for (uint32_t n = 0; n < 4; n++) {
    f.push(0, 20, n);
  }
  // frames per second not known yet, next second waits
  f.push(0, 21, 0);
  f.push(0, 21, 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 4);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 2);
  f.push(0, 21, 2);
  f.push(0, 21, 3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 4);

  // second 21 has passed, 4 frames per second from now on
  f.push(0, 22, 0);
  using key = std::pair<uint32_t, uint32_t>;
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.keys() == std::vector<key>{
      {20, 0}, {20, 1}, {20, 2}, {20, 3}, {21, 0}, {21, 1}, {21, 2}, {21, 3}, {22, 0}}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.forced_flushes) == 0);

  f.push(0, 22, 2);
  f.push(0, 22, 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[9]) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[10]) == 2);
}

void test_learning_keeps_early_next_second_in_window() {
  // 4 frames per second, frame 3 not seen yet when second 11 begins
  reorder_fixture f{make_config(8)};
  f.push(0, 10, 0);
  f.push(0, 10, 2);
  f.push(0, 11, 0);
  f.push(0, 10, 1);
  f.push(0, 10, 3);
  using key = std::pair<uint32_t, uint32_t>;
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.keys() == std::vector<key>{{10, 0}, {10, 1}, {10, 2}, {10, 3}}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);

  f.buffer.poll(f.now + std::chrono::milliseconds{100}, f.emitter());
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 5);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<1>(f.emitted[4]) == 11);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[4]) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.timed_flushes) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);
}

void test_sender_restart(bool drop_stale) {
  reorder_fixture f{make_config(8, drop_stale, 4)};
  for (uint32_t n = 0; n < 4; n++) {
    f.push(0, 1000, n);
  }
  // sender restarted with earlier timestamps
  for (uint32_t s = 5; s < 8; s++) {
    for (uint32_t n = 0; n < 4; n++) {
      f.push(0, s, n);
    }
  }
  f.push(0, 8, 1);
  f.push(0, 8, 0);

  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 4 + 14);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<1>(f.emitted[4]) == 5);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[16]) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<2>(f.emitted[17]) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.resyncs) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.stale_frames_dropped) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.last_emitted(0)->seconds_since_epoch == 8);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.last_emitted(0)->frame_number == 1);

  // slightly late frame is still late, not a restart
  f.push(0, 8, 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.resyncs) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 1);
}

void test_reference_epoch_change() {
  reorder_fixture f{make_config(8)};
  f.push_with_epoch(40, 100, 0);
  f.push_with_epoch(40, 100, 1);
  f.push_with_epoch(40, 100, 3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 1);

  // held frame of old epoch is flushed before new epoch starts
  f.push_with_epoch(41, 0, 0);
  f.push_with_epoch(41, 0, 1);
  using key = std::pair<uint32_t, uint32_t>;
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.keys() == std::vector<key>{{100, 0}, {100, 1}, {100, 3}, {0, 0}, {0, 1}}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.resyncs) == 1);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.late_frames) == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 1);
}

void test_independent_threads() {
  reorder_fixture f{make_config(8)};
  f.push(0, 0, 1);
  f.push(1, 0, 1);
  f.push(0, 0, 3);
  f.push(1, 0, 3);
  f.push(1, 0, 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 1);
  f.push(0, 0, 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);

  std::vector<uint32_t> thread_0, thread_1;
  for (const auto& [thread_id, seconds, frame_number, tag] : f.emitted) {
    (thread_id == 0 ? thread_0 : thread_1).push_back(frame_number);
  }
  VDIFRX_CHECK_TEST_REORDER_BUFFER((thread_0 == std::vector<uint32_t>{1, 2, 3}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER((thread_1 == std::vector<uint32_t>{1, 2, 3}));
}

void test_transport_sequence_tie_break() {
  reorder_fixture f{make_config(4)};
  f.push(0, 0, 1, 1, 1);
  f.push(0, 0, 3, 20, 20);
  f.push(0, 0, 3, 10, 10);
  f.push(0, 0, 2, 2, 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.emitted.size() == 4);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<3>(f.emitted[2]) == 10);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(std::get<3>(f.emitted[3]) == 20);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.duplicate_frames) == 1);
}

void test_flush_all() {
  reorder_fixture f{make_config(8)};
  f.push(1);
  f.push(5);
  f.push(3);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 2);
  f.buffer.flush_all(f.emitter());
  VDIFRX_CHECK_TEST_REORDER_BUFFER((f.frame_numbers() == std::vector<uint32_t>{1, 3, 5}));
  VDIFRX_CHECK_TEST_REORDER_BUFFER(f.buffer.held_count() == 0);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.sequence_gaps) == 2);
  VDIFRX_CHECK_TEST_REORDER_BUFFER(r::get(f.statistics.frames_lost) == 2);
}

int main() {
  test_simple_reorder();
  test_far_ahead_and_late();
  test_window_overflow();
  test_timed_flush();
  test_second_boundary();
  test_learned_frames_per_second();
  test_learning_keeps_early_next_second_in_window();
  test_sender_restart(false);
  test_sender_restart(true);
  test_reference_epoch_change();
  test_independent_threads();
  test_transport_sequence_tie_break();
  test_flush_all();
  return 0;
}
