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
#ifndef __VDIFRX_IO_UDP_COMMON__
#define __VDIFRX_IO_UDP_COMMON__

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>

#include "vdifrx/commons.hpp"

namespace vdifrx {
namespace io {
namespace udp {

struct socket_wrapper {
  int sock;

  explicit socket_wrapper() {
    sock = socket(PF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
      throw vdif_error{errc::socket_failure,
                       std::string{"udp socket creation error: "} +
                           std::strerror(errno)};
    }
  }

  socket_wrapper(const socket_wrapper&) = delete;
  socket_wrapper& operator=(const socket_wrapper&) = delete;

  ~socket_wrapper() { close(sock); }
};

/**
 * @brief counters of a receiver, written by receiver thread only,
 *        may be read from any thread.
 */
struct receiver_statistics {
  using counter_type = std::atomic<vdifrx::packet_counter_type>;

  counter_type datagrams_received = 0;
  counter_type batches_received = 0;
  counter_type receive_timeouts = 0;
  counter_type frames_emitted = 0;
  /** @brief datagrams failed to parse, or length mismatch with header */
  counter_type malformed_datagrams = 0;
  /** @brief count of gaps in sequence, i.e. loss events */
  counter_type sequence_gaps = 0;
  /** @brief estimated count of frames never received */
  counter_type frames_lost = 0;
  /** @brief frames arrived behind last emitted frame */
  counter_type late_frames = 0;
  /** @brief frames with same key as a frame emitted or held */
  counter_type duplicate_frames = 0;
  counter_type stale_frames_dropped = 0;
  /** @brief frames dropped because consumer is too slow */
  counter_type ring_full_drops = 0;
  /** @brief flushes of held frames because window is full or skipped over */
  counter_type forced_flushes = 0;
  /** @brief flushes of held frames because they waited too long */
  counter_type timed_flushes = 0;
  /** @brief times a thread restarted, i.e. key jumped back or epoch changed */
  counter_type resyncs = 0;

  static void increase(counter_type& counter,
                       vdifrx::packet_counter_type n = 1) noexcept {
    counter.fetch_add(n, std::memory_order_relaxed);
  }

  static auto get(const counter_type& counter) noexcept
      -> vdifrx::packet_counter_type {
    return counter.load(std::memory_order_relaxed);
  }

  /** @brief ratio of lost frames to all frames expected */
  auto loss_rate() const noexcept -> double {
    const auto lost = get(frames_lost);
    const auto received = get(datagrams_received);
    if (lost + received == 0) {
      return 0.0;
    }
    return 1.0 * lost / (lost + received);
  }
};

inline auto operator<<(std::ostream& os, const receiver_statistics& s)
    -> std::ostream& {
  using r = receiver_statistics;
  os << "datagrams_received = " << r::get(s.datagrams_received)
     << ", batches_received = " << r::get(s.batches_received)
     << ", receive_timeouts = " << r::get(s.receive_timeouts)
     << ", frames_emitted = " << r::get(s.frames_emitted)
     << ", malformed_datagrams = " << r::get(s.malformed_datagrams)
     << ", sequence_gaps = " << r::get(s.sequence_gaps)
     << ", frames_lost = " << r::get(s.frames_lost)
     << ", late_frames = " << r::get(s.late_frames)
     << ", duplicate_frames = " << r::get(s.duplicate_frames)
     << ", stale_frames_dropped = " << r::get(s.stale_frames_dropped)
     << ", ring_full_drops = " << r::get(s.ring_full_drops)
     << ", forced_flushes = " << r::get(s.forced_flushes)
     << ", timed_flushes = " << r::get(s.timed_flushes)
     << ", resyncs = " << r::get(s.resyncs);
  return os;
}

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  //  __VDIFRX_IO_UDP_COMMON__
