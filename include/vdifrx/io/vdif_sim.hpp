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
#ifndef __VDIFRX_IO_VDIF_SIM__
#define __VDIFRX_IO_VDIF_SIM__

#include <cstddef>
#include <cstdint>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/vdif_frame.hpp"
#include "vdifrx/io/vdif_header.hpp"

namespace vdifrx {
namespace io {

/**
 * @brief generates a stream of valid VDIF frames for testing.
 * 
 * Frames have epoch 3, station 134, one channel of 2-bit real samples,
 * all samples being code 0. Counters advance in order
 * frame number -> thread id -> second, i.e. all frames of thread 0 of
 * a second come first, then thread 1, ...
 */
class frame_simulator {
 public:
  static inline constexpr uint32_t reference_epoch = 3;
  static inline constexpr uint32_t station_id = 134;
  static inline constexpr uint32_t bits_per_sample = 2;

 protected:
  vdif_header header;
  std::vector<std::byte> payload;
  uint32_t frames_per_second;
  uint32_t thread_count;

 public:
  /**
   * @param frame_size total frame size in bytes, multiple of 8, header included
   * @param frames_per_second_ frames in one second of one thread
   * @param thread_count_ count of threads
   */
  frame_simulator(size_t frame_size, uint32_t frames_per_second_,
                  uint32_t thread_count_ = 1, uint32_t start_second = 0)
      : frames_per_second{frames_per_second_}, thread_count{thread_count_} {
    if (frames_per_second == 0 || thread_count == 0) [[unlikely]] {
      throw vdif_error{errc::out_of_range,
                       "frames_per_second and thread_count must be positive"};
    }
    header.set_legacy(false)
        .set_invalid(false)
        .set_reference_epoch(reference_epoch)
        .set_seconds_since_epoch(start_second)
        .set_frame_number(0)
        .set_vdif_version(0)
        .set_log2_channels(0)
        .set_frame_bytes(frame_size)
        .set_complex(false)
        .set_bits_per_sample(bits_per_sample)
        .set_thread_id(0)
        .set_station_id(station_id);
    payload.resize(header.payload_bytes(), std::byte{0});
    // frame_number of last frame of a second has to fit in header
    vdif_header{}.set_frame_number(frames_per_second - 1);
    vdif_header{}.set_thread_id(thread_count - 1);
  }

  /** @brief header of frame to be generated next */
  auto peek_header() const -> const vdif_header& { return header; }

  auto generate_frame() -> vdif_frame {
    vdif_frame frame = vdif_frame::from_parts(header, payload);
    advance();
    return frame;
  }

 protected:
  void advance() {
    if (header.frame_number() + 1 >= frames_per_second) {
      header.set_frame_number(0);
      if (header.thread_id() + 1 >= thread_count) {
        header.set_thread_id(0);
        header.set_seconds_since_epoch(header.seconds_since_epoch() + 1);
      } else {
        header.set_thread_id(header.thread_id() + 1);
      }
    } else {
      header.set_frame_number(header.frame_number() + 1);
    }
  }
};

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_VDIF_SIM__
