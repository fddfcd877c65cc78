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
#ifndef __VDIFRX_CONFIG__
#define __VDIFRX_CONFIG__

#include <cstddef>  // for size_t
#include <cstdint>
#include <string>

namespace vdifrx {

// ------ Compile time configuration ------

inline constexpr size_t CACHE_LINE_SIZE = 64ul;

inline constexpr size_t BITS_PER_WORD = 32ul;

inline constexpr size_t BYTES_PER_WORD = 4ul;

inline constexpr size_t UDP_MAX_SIZE = 1 << 16;

/** @brief header length of a standard VDIF frame, 8 words */
inline constexpr size_t VDIF_HEADER_SIZE = 32ul;

/** @brief header length of a legacy VDIF frame, 4 words */
inline constexpr size_t VDIF_LEGACY_HEADER_SIZE = 16ul;

/** @brief frame_length field of header counts in this unit */
inline constexpr size_t VDIF_FRAME_LENGTH_UNIT = 8ul;

/** @brief size of the sequence number prefix of VTP */
inline constexpr size_t VTP_HEADER_SIZE = 8ul;

using packet_counter_type = uint64_t;

// ------ Runtime configuration ------

/**
 * @brief Runtime configuration.
 * @note module specific config names should prepend module name
 * @note this struct is named configs so that vdifrx::config is a variable
 * @note remember to add program options parser in vdifrx/program_options.hpp
 *       if an option is added here.
 * @see vdifrx::config in vdifrx/global_variables.hpp
 */
struct configs {
  /**
   * @brief Path to config file to be used to read other configs.
   */
  std::string config_file_name = "vdifrx_config.cfg";

  /**
    * @brief Debug level for console log output.
    * @see vdifrx::log::level
    */
  /* vdifrx::log::level */ int log_level = /* vdifrx::log::level::INFO */ 3;

  /**
   * @brief Address to receive VDIF UDP packets.
   */
  std::string receiver_address = "0.0.0.0";

  /**
   * @brief Port to receive VDIF UDP packets.
   */
  unsigned short receiver_port = 12004;

  /**
   * @brief CPU core that UDP receiver should be bound to, -1 to disable
   */
  int receiver_cpu_preferred = -1;

  /**
   * @brief Max count of datagrams received in one system call.
   */
  size_t batch_size = 64;

  /**
   * @brief Timeout of one batched receive, in milliseconds.
   *        Also bounds the latency of stopping the receiver.
   */
  size_t receive_timeout = 1000;

  /**
   * @brief Size of buffer for one datagram. Longer datagrams are malformed.
   */
  size_t max_datagram_size = 9000;

  /**
   * @brief if 1, each datagram starts with a transport header (VTP)
   *        carrying a sequence number, followed by the VDIF frame.
   */
  bool transport_wrapper = false;

  /**
   * @brief Length of transport header, in bytes.
   *        First 8 bytes is little endian sequence number.
   */
  size_t transport_header_size = VTP_HEADER_SIZE;

  /**
   * @brief Reorder window of each thread: frames at most this many frames
   *        ahead of the last emitted one are held, at most this many at once.
   *        A gap of n missing frames can be bridged with capacity n + 1.
   */
  size_t reorder_window_capacity = 64;

  /**
   * @brief Max time a frame may be held for reordering, in milliseconds.
   */
  size_t reorder_max_wait = 100;

  /**
   * @brief Frames per second of each thread.
   *        0 means learn from stream (max frame number seen + 1).
   */
  uint32_t frames_per_second = 0;

  /**
   * @brief if 1, late or duplicated frames are dropped;
   *        if 0, they are passed through in arrival order.
   */
  bool drop_stale_frames = false;

  /**
   * @brief Count of frames between UDP receiver and consumer.
   *        Rounded up to power of 2.
   */
  size_t ring_buffer_capacity = 1 << 14;

  /**
   * @brief if 1, frames with vdif_version other than 0 are malformed.
   */
  bool strict_version = false;

  /**
   * @brief Path to write received frames. Empty to disable.
   */
  std::string output_file_path = "";

  /**
   * @brief Interval of logging receiver statistics, in milliseconds.
   */
  size_t statistics_interval = 1000;

  /**
   * @brief Path to the VDIF file to be read.
   */
  std::string input_file_path = "";

  /**
   * @brief Size of each frame in input file, in bytes.
   *        0 means read frame length from each header.
   */
  size_t frame_size = 0;

  /**
   * @brief Address to send simulated frames.
   */
  std::string sim_destination_address = "127.0.0.1";

  /**
   * @brief Port to send simulated frames.
   */
  unsigned short sim_destination_port = 12004;

  /**
   * @brief Size of each simulated frame, in bytes, header included.
   */
  size_t sim_frame_size = 8032;

  /**
   * @brief Count of frames to send, 0 for unlimited.
   */
  size_t sim_frame_count = 10000;

  /**
   * @brief Frames per second of each simulated thread.
   */
  uint32_t sim_frames_per_second = 1000;

  /**
   * @brief Count of simulated threads, interleaved.
   */
  uint32_t sim_thread_count = 1;

  /**
   * @brief Frames are shuffled within blocks of this size before sending,
   *        0 or 1 to keep order.
   */
  size_t sim_shuffle_distance = 0;
};

}  // namespace vdifrx

#endif  // __VDIFRX_CONFIG__
