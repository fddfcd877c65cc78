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
#ifndef __VDIFRX_IO_UDP_VDIF_RECEIVER__
#define __VDIFRX_IO_UDP_VDIF_RECEIVER__

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/udp/packet_parser.hpp"
#include "vdifrx/io/udp/recvmmsg_packet_provider.hpp"
#include "vdifrx/io/udp/reorder_buffer.hpp"
#include "vdifrx/io/udp/udp_common.hpp"
#include "vdifrx/io/vdif_frame.hpp"
#include "vdifrx/memory/spsc_ring_buffer.hpp"
#include "vdifrx/thread_affinity.hpp"

namespace vdifrx {
namespace io {
namespace udp {

struct receiver_config {
  std::string address = "0.0.0.0";
  unsigned short port = 12004;
  /** @brief CPU core for receiving thread, -1 to not bind */
  int cpu_preferred = -1;
  size_t batch_size = 64;
  size_t max_datagram_size = 9000;
  std::chrono::milliseconds receive_timeout{1000};
  bool transport_wrapper = false;
  size_t transport_header_size = VTP_HEADER_SIZE;
  bool strict_version = false;
  reorder_config reorder;

  static auto from(const vdifrx::configs& config) -> receiver_config {
    receiver_config c;
    c.address = config.receiver_address;
    c.port = config.receiver_port;
    c.cpu_preferred = config.receiver_cpu_preferred;
    c.batch_size = config.batch_size;
    c.max_datagram_size = config.max_datagram_size;
    c.receive_timeout = std::chrono::milliseconds{config.receive_timeout};
    c.transport_wrapper = config.transport_wrapper;
    c.transport_header_size = config.transport_header_size;
    c.strict_version = config.strict_version;
    c.reorder.window_capacity = config.reorder_window_capacity;
    c.reorder.max_wait = std::chrono::milliseconds{config.reorder_max_wait};
    c.reorder.frames_per_second = config.frames_per_second;
    c.reorder.drop_stale = config.drop_stale_frames;
    return c;
  }
};

enum class receiver_state { idle, receiving, stopped };

/**
 * @brief Receives VDIF frames from UDP in batches, restores order of each
 *        thread as much as the reorder window allows, and pushes them into
 *        a ring buffer for the consumer.
 * 
 * Receiving runs on its own thread between @c start() and @c stop() ;
 * malformed datagrams are counted and skipped, full ring buffer drops the
 * frame and counts it. On stop or socket failure held frames are flushed
 * and the ring buffer is closed. A socket failure is kept and re-thrown
 * by @c rethrow_if_failed() .
 * 
 * @tparam PacketProvider provides @c receive_batch() , @c datagram(i) ,
 *         @c truncated(i) and @c local_port() ,
 *         see @c vdifrx::io::udp::recvmmsg_packet_provider
 */
template <typename PacketProvider = recvmmsg_packet_provider>
class vdif_receiver {
 public:
  using packet_provider_t = PacketProvider;
  using ring_buffer_t = vdifrx::memory::spsc_ring_buffer<vdif_frame>;

 protected:
  receiver_config config;
  ring_buffer_t& ring_buffer;
  receiver_statistics statistics;
  std::optional<PacketProvider> packet_provider;
  vdif_packet_parser packet_parser;
  reorder_buffer reorder;
  /** @brief storage for next frame, recycled through ring buffer */
  vdif_frame incoming_frame;

  std::atomic<receiver_state> state = receiver_state::idle;
  std::exception_ptr failure;
  std::jthread receive_thread;

  void emit(vdif_frame& frame) {
    if (ring_buffer.try_push_exchange(frame)) [[likely]] {
      receiver_statistics::increase(statistics.frames_emitted);
    } else {
      receiver_statistics::increase(statistics.ring_full_drops);
    }
  }

  void handle_datagram(std::span<const std::byte> udp_packet_buffer,
                       reorder_buffer::time_point now) {
    uint64_t transport_sequence = 0;
    try {
      const auto [header_size, counter] = packet_parser.parse(udp_packet_buffer);
      transport_sequence = counter;
      incoming_frame.assign_from_bytes(udp_packet_buffer.subspan(header_size),
                                       config.strict_version);
    } catch (const vdif_error& e) {
      if (e.code() == errc::assertion_failed) [[unlikely]] {
        throw;
      }
      receiver_statistics::increase(statistics.malformed_datagrams);
      VDIFRX_LOGD << " [vdif receiver] "
                  << "discarded malformed datagram of "
                  << udp_packet_buffer.size() << " bytes: " << e.what()
                  << vdifrx::endl;
      return;
    }
    reorder.push(incoming_frame, transport_sequence, now,
                 [this](vdif_frame& frame) { emit(frame); });
  }

  void receive_loop(std::stop_token stop_token) {
    PacketProvider& provider = packet_provider.value();
    while (!stop_token.stop_requested()) {
      const size_t n_packet = provider.receive_batch();
      const auto now = reorder_buffer::clock_type::now();
      if (n_packet == 0) {
        receiver_statistics::increase(statistics.receive_timeouts);
      } else {
        receiver_statistics::increase(statistics.batches_received);
        receiver_statistics::increase(statistics.datagrams_received, n_packet);
        for (size_t i = 0; i < n_packet; i++) {
          if (provider.truncated(i)) [[unlikely]] {
            receiver_statistics::increase(statistics.malformed_datagrams);
            VDIFRX_LOGD << " [vdif receiver] "
                        << "discarded datagram longer than "
                        << config.max_datagram_size << " bytes"
                        << vdifrx::endl;
            continue;
          }
          handle_datagram(provider.datagram(i), now);
        }
      }
      reorder.poll(now, [this](vdif_frame& frame) { emit(frame); });
    }
  }

  void run(std::stop_token stop_token) {
    vdifrx::thread_affinity::set_thread_name("vdif_receiver");
    if (config.cpu_preferred >= 0) {
      vdifrx::thread_affinity::set_thread_affinity(
          static_cast<unsigned int>(config.cpu_preferred));
    }
    try {
      VDIFRX_LOGI << " [vdif receiver] "
                  << "receiving on " << config.address << ":"
                  << local_port() << vdifrx::endl;
      receive_loop(stop_token);
    } catch (const std::exception& e) {
      VDIFRX_LOGE << " [vdif receiver] "
                  << "stopped on error: " << e.what() << vdifrx::endl;
      failure = std::current_exception();
    }
    // best effort
    reorder.flush_all([this](vdif_frame& frame) { emit(frame); });
    ring_buffer.close();
    state.store(receiver_state::stopped, std::memory_order_release);
    VDIFRX_LOGI << " [vdif receiver] "
                << "stopped, " << statistics << vdifrx::endl;
  }

 public:
  vdif_receiver(const receiver_config& config_, ring_buffer_t& ring_buffer_)
      : config{config_},
        ring_buffer{ring_buffer_},
        packet_parser{.transport_wrapper = config_.transport_wrapper,
                      .transport_header_size = config_.transport_header_size},
        reorder{config_.reorder, statistics} {
    if (config.transport_wrapper &&
        config.transport_header_size < vdif_packet_parser::counter_size)
        [[unlikely]] {
      throw std::invalid_argument{
          "transport_header_size " +
          std::to_string(config.transport_header_size) + " is less than " +
          std::to_string(vdif_packet_parser::counter_size)};
    }
    if (config.max_datagram_size == 0 ||
        config.max_datagram_size > UDP_MAX_SIZE) [[unlikely]] {
      throw std::invalid_argument{"max_datagram_size " +
                                  std::to_string(config.max_datagram_size) +
                                  " not in (0, " +
                                  std::to_string(UDP_MAX_SIZE) + "]"};
    }
  }

  vdif_receiver(const vdif_receiver&) = delete;
  vdif_receiver& operator=(const vdif_receiver&) = delete;

  ~vdif_receiver() { stop(); }

  /**
   * @brief bind socket on caller thread, then start receiving thread.
   * @throw vdif_error socket_failure if socket cannot be set up
   */
  void start() {
    start_with_provider(config.address, config.port, config.batch_size,
                        config.max_datagram_size, config.receive_timeout);
  }

  /**
   * @brief construct packet provider from @c args on caller thread,
   *        then start receiving thread.
   */
  template <typename... Args>
  void start_with_provider(Args&&... args) {
    BOOST_ASSERT_MSG(state.load() == receiver_state::idle,
                     "receiver can only be started once");
    packet_provider.emplace(std::forward<Args>(args)...);
    state.store(receiver_state::receiving, std::memory_order_release);
    receive_thread = std::jthread{
        [this](std::stop_token stop_token) { run(stop_token); }};
  }

  /**
   * @brief request receiving thread to stop and wait for it;
   *        latency is bounded by receive timeout.
   */
  void stop() {
    if (receive_thread.joinable()) {
      receive_thread.request_stop();
      receive_thread.join();
    }
  }

  auto current_state() const noexcept -> receiver_state {
    return state.load(std::memory_order_acquire);
  }

  /** @brief re-throw error that stopped receiving thread, only once */
  void rethrow_if_failed() {
    if (current_state() == receiver_state::stopped && failure) {
      std::exception_ptr e = std::exchange(failure, nullptr);
      std::rethrow_exception(e);
    }
  }

  auto get_statistics() const noexcept -> const receiver_statistics& {
    return statistics;
  }

  /** @brief port bound, available after @c start() */
  auto local_port() const -> unsigned short {
    BOOST_ASSERT(packet_provider.has_value());
    return packet_provider->local_port();
  }

  /**
   * @brief log statistics, warn if new loss detected since last call.
   * @note call from one thread only
   */
  void log_statistics() {
    const auto frames_lost = receiver_statistics::get(statistics.frames_lost);
    const auto malformed =
        receiver_statistics::get(statistics.malformed_datagrams);
    const auto ring_full = receiver_statistics::get(statistics.ring_full_drops);
    const auto current_lost = frames_lost - last_logged.frames_lost;
    const auto current_malformed = malformed - last_logged.malformed;
    const auto current_ring_full = ring_full - last_logged.ring_full;
    if (current_lost > 0) {
      VDIFRX_LOGW << " [vdif receiver] "
                  << "data loss detected: " << current_lost
                  << " frames this round. "
                  << "overall loss rate: " << statistics.loss_rate()
                  << vdifrx::endl;
    }
    if (current_malformed > 0) {
      VDIFRX_LOGW << " [vdif receiver] " << current_malformed
                  << " malformed datagrams this round" << vdifrx::endl;
    }
    if (current_ring_full > 0) {
      VDIFRX_LOGW << " [vdif receiver] " << current_ring_full
                  << " frames dropped as ring buffer is full, "
                  << "consumer too slow?" << vdifrx::endl;
    }
    VDIFRX_LOGI << " [vdif receiver] " << statistics << vdifrx::endl;
    last_logged = logged_counters{.frames_lost = frames_lost,
                                  .malformed = malformed,
                                  .ring_full = ring_full};
  }

 protected:
  struct logged_counters {
    vdifrx::packet_counter_type frames_lost = 0;
    vdifrx::packet_counter_type malformed = 0;
    vdifrx::packet_counter_type ring_full = 0;
  };
  logged_counters last_logged;
};

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  //  __VDIFRX_IO_UDP_VDIF_RECEIVER__
