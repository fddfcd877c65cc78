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

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <thread>
#include <vector>

#include "vdifrx/commons.hpp"
// -- divide line for clang-format --
#include "test-common.hpp"
#include "vdifrx/io/udp/frame_sender.hpp"
#include "vdifrx/io/udp/vdif_receiver.hpp"
#include "vdifrx/io/vdif_sim.hpp"

#define VDIFRX_CHECK_TEST_UDP_RECEIVER(expr) \
  VDIFRX_CHECK_TEST("[test-udp_receiver] ", expr)

using vdifrx::io::vdif_frame;
using vdifrx::io::udp::receiver_state;
using vdifrx::io::udp::receiver_statistics;
using r = receiver_statistics;
using datagram_type = std::vector<std::byte>;

/** @brief datagrams handed out by scripted_packet_provider, batch by batch */
struct packet_script {
  struct batch {
    std::vector<datagram_type> datagrams;
    /** @brief receiving this batch fails like a broken socket */
    bool fail = false;
  };
  std::vector<batch> batches;
  /** @brief count of batches that may be received, others time out */
  std::atomic<size_t> released = 0;
};

class scripted_packet_provider {
 protected:
  packet_script& script;
  size_t next_batch = 0;
  const packet_script::batch* current = nullptr;

 public:
  explicit scripted_packet_provider(packet_script& script_) : script{script_} {}

  auto receive_batch() -> size_t {
    if (next_batch >= script.batches.size() ||
        next_batch >= script.released.load()) {
      current = nullptr;
      std::this_thread::sleep_for(std::chrono::milliseconds{1});
      return 0;
    }
    current = &script.batches.at(next_batch);
    next_batch++;
    if (current->fail) {
      throw vdifrx::vdif_error{vdifrx::errc::socket_failure,
                               "recvmmsg failed: Connection refused"};
    }
    return current->datagrams.size();
  }

  auto datagram(size_t i) const -> std::span<const std::byte> {
    return current->datagrams.at(i);
  }

  auto truncated(size_t) const -> bool { return false; }

  auto local_port() const -> unsigned short { return 0; }
};

using scripted_receiver = vdifrx::io::udp::vdif_receiver<scripted_packet_provider>;

/** @brief wire bytes of frames 0 ~ count-1 of thread 0, 1000 frames per second */
auto simulated_datagrams(uint32_t count) -> std::vector<datagram_type> {
  vdifrx::io::frame_simulator simulator{1032, 1000};
  std::vector<datagram_type> datagrams;
  for (uint32_t i = 0; i < count; i++) {
    datagrams.push_back(simulator.generate_frame().to_bytes());
  }
  return datagrams;
}

auto pick(const std::vector<datagram_type>& datagrams,
          std::initializer_list<uint32_t> indices) -> std::vector<datagram_type> {
  std::vector<datagram_type> out;
  for (auto i : indices) {
    out.push_back(datagrams.at(i));
  }
  return out;
}

auto scripted_config() -> vdifrx::io::udp::receiver_config {
  vdifrx::io::udp::receiver_config config;
  config.reorder.window_capacity = 8;
  config.reorder.max_wait = std::chrono::seconds{5};
  config.reorder.frames_per_second = 1000;
  return config;
}

template <typename Predicate>
auto wait_until(Predicate&& predicate) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}

void test_ring_buffer_full() {
  const auto datagrams = simulated_datagrams(12);
  packet_script script;
  script.batches.push_back({.datagrams = pick(datagrams, {0, 1, 2, 3, 4, 5, 6, 7, 8, 9})});
  script.batches.push_back({.datagrams = pick(datagrams, {10, 11})});
  script.released = 1;

  vdifrx::memory::spsc_ring_buffer<vdif_frame> ring_buffer{4};
  scripted_receiver receiver{scripted_config(), ring_buffer};
  receiver.start_with_provider(script);
  const auto& statistics = receiver.get_statistics();

  // consumer does not pop yet, so only 4 frames fit
  VDIFRX_CHECK_TEST_UDP_RECEIVER(wait_until([&]() {
    return r::get(statistics.frames_emitted) + r::get(statistics.ring_full_drops) == 10;
  }));
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_emitted) == 4);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.ring_full_drops) == 6);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(receiver.current_state() == receiver_state::receiving);

  vdif_frame frame;
  for (uint32_t i = 0; i < 4; i++) {
    VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.try_pop(frame));
    VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == i);
  }

  // receiving goes on once consumer catches up
  script.released = 2;
  VDIFRX_CHECK_TEST_UDP_RECEIVER(wait_until([&]() {
    return r::get(statistics.frames_emitted) == 6;
  }));
  for (uint32_t i = 10; i < 12; i++) {
    VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.try_pop(frame));
    VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == i);
  }

  receiver.stop();
  receiver.rethrow_if_failed();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.ring_full_drops) == 6);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.datagrams_received) == 12);
}

void test_socket_failure_while_receiving() {
  const auto datagrams = simulated_datagrams(4);
  packet_script script;
  script.batches.push_back({.datagrams = pick(datagrams, {0, 2, 3})});
  script.batches.push_back({.fail = true});
  script.released = 2;

  vdifrx::memory::spsc_ring_buffer<vdif_frame> ring_buffer{16};
  scripted_receiver receiver{scripted_config(), ring_buffer};
  receiver.start_with_provider(script);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(wait_until([&]() {
    return receiver.current_state() == receiver_state::stopped;
  }));

  // held frames are flushed before ring buffer is closed
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.closed());
  vdif_frame frame;
  for (uint32_t i : {0, 2, 3}) {
    VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.blocking_pop(frame, std::chrono::seconds{1}) ==
                                   vdifrx::memory::pop_status::ok);
    VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == i);
  }
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.blocking_pop(frame, std::chrono::seconds{1}) ==
                                 vdifrx::memory::pop_status::closed);

  const auto& statistics = receiver.get_statistics();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_emitted) == 3);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.sequence_gaps) == 1);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_lost) == 1);

  // error is re-thrown to owner exactly once
  VDIFRX_CHECK_TEST_UDP_RECEIVER(throws_vdif_error(
      vdifrx::errc::socket_failure, [&]() { receiver.rethrow_if_failed(); }));
  receiver.rethrow_if_failed();
  receiver.stop();
}

void test_timed_flush_while_idle() {
  const auto datagrams = simulated_datagrams(3);
  packet_script script;
  script.batches.push_back({.datagrams = pick(datagrams, {0, 2})});
  script.released = 1;

  auto config = scripted_config();
  config.reorder.max_wait = std::chrono::milliseconds{20};
  vdifrx::memory::spsc_ring_buffer<vdif_frame> ring_buffer{16};
  scripted_receiver receiver{config, ring_buffer};
  receiver.start_with_provider(script);
  const auto& statistics = receiver.get_statistics();

  // frame 1 never comes, frame 2 is released after max wait
  VDIFRX_CHECK_TEST_UDP_RECEIVER(wait_until([&]() {
    return r::get(statistics.frames_emitted) == 2;
  }));
  VDIFRX_CHECK_TEST_UDP_RECEIVER(receiver.current_state() == receiver_state::receiving);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.timed_flushes) == 1);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.receive_timeouts) > 0);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_lost) == 1);

  vdif_frame frame;
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.try_pop(frame));
  VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == 0);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.try_pop(frame));
  VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == 2);

  receiver.stop();
  receiver.rethrow_if_failed();
}

void test_loopback() {
  // init enivronment
  const std::string address = "127.0.0.1";
  constexpr size_t frame_size = 1032;
  constexpr uint32_t frame_count = 64;
  vdifrx::log::current_level = vdifrx::log::level::DEBUG;

  vdifrx::io::udp::receiver_config config;
  config.address = address;
  config.port = 0;  // any free port
  config.batch_size = 16;
  config.max_datagram_size = 2048;
  config.receive_timeout = std::chrono::milliseconds{50};
  config.transport_wrapper = true;
  config.reorder.window_capacity = 8;
  config.reorder.max_wait = std::chrono::seconds{5};
  config.reorder.frames_per_second = 1000;

  vdifrx::memory::spsc_ring_buffer<vdif_frame> ring_buffer{128};
  vdifrx::io::udp::vdif_receiver<> receiver{config, ring_buffer};
  VDIFRX_CHECK_TEST_UDP_RECEIVER(receiver.current_state() == receiver_state::idle);
  receiver.start();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(receiver.current_state() == receiver_state::receiving);
  const unsigned short port = receiver.local_port();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(port != 0);

  // port already taken
  {
    vdifrx::memory::spsc_ring_buffer<vdif_frame> other_ring_buffer{4};
    auto other_config = config;
    other_config.port = port;
    vdifrx::io::udp::vdif_receiver<> other{other_config, other_ring_buffer};
    VDIFRX_CHECK_TEST_UDP_RECEIVER(throws_vdif_error(
        vdifrx::errc::socket_failure, [&]() { other.start(); }));
  }

  // prepare data
  vdifrx::io::frame_simulator simulator{frame_size, 1000};
  std::vector<vdif_frame> frames;
  for (uint32_t i = 0; i < frame_count; i++) {
    frames.push_back(simulator.generate_frame());
  }
  // sent as 0, 2, 1, 4, 3, ..., 62, 61, 63
  std::vector<uint32_t> send_order = {0};
  for (uint32_t i = 1; i + 1 < frame_count; i += 2) {
    send_order.push_back(i + 1);
    send_order.push_back(i);
  }
  send_order.push_back(frame_count - 1);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(send_order.size() == frame_count);

  // send data
  vdifrx::io::udp::frame_sender sender{address, port, true};
  sender.send_datagram(make_bytes({1, 2, 3, 4}));
  // VTP header followed by a truncated VDIF header
  sender.send_datagram(make_bytes({0, 0, 0, 0, 0, 0, 0, 0, 1, 2, 3, 4}));
  for (auto i : send_order) {
    sender.send_frame(frames.at(i));
  }
  VDIFRX_CHECK_TEST_UDP_RECEIVER(sender.frames_sent() == frame_count);
  VDIFRX_LOGI << " [test-udp_receiver] "
              << "data sent" << vdifrx::endl;

  // check order of received frames
  vdif_frame frame;
  for (uint32_t i = 0; i < frame_count; i++) {
    const auto status =
        ring_buffer.blocking_pop(frame, std::chrono::seconds{5});
    VDIFRX_CHECK_TEST_UDP_RECEIVER(status == vdifrx::memory::pop_status::ok);
    VDIFRX_CHECK_TEST_UDP_RECEIVER(frame.header().frame_number() == i);
    VDIFRX_CHECK_TEST_UDP_RECEIVER(frame == frames.at(i));
  }

  receiver.stop();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(receiver.current_state() == receiver_state::stopped);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.closed());
  VDIFRX_CHECK_TEST_UDP_RECEIVER(ring_buffer.blocking_pop(frame, std::chrono::seconds{1}) ==
                                 vdifrx::memory::pop_status::closed);
  receiver.rethrow_if_failed();
  receiver.log_statistics();

  const auto& statistics = receiver.get_statistics();
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.datagrams_received) == frame_count + 2);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.malformed_datagrams) == 2);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_emitted) == frame_count);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.sequence_gaps) == 0);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.frames_lost) == 0);
  VDIFRX_CHECK_TEST_UDP_RECEIVER(r::get(statistics.ring_full_drops) == 0);
}

int main() {
  test_loopback();
  test_ring_buffer_full();
  test_socket_failure_while_receiving();
  test_timed_flush_while_idle();
  return 0;
}
