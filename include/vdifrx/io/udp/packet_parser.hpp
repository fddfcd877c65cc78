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
#ifndef __VDIFRX_IO_UDP_PACKET_PARSER__
#define __VDIFRX_IO_UDP_PACKET_PARSER__

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <tuple>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/bit_packing.hpp"

namespace vdifrx {
namespace io {
namespace udp {

// parse packet to get: transport header size, transport sequence number

/**
 * @brief Datagram carrying a VDIF frame, optionally prefixed by VTP.
 * 
 * Target packet structure with VTP (x = 1 byte, in little endian):
 *     xxxxxxxx ...... xxxx......xxxx
 *     |<--1->| |<-2->| |<----3---->|
 *   1. sequence number of type uint64_t, increasing with each datagram sent
 *   2. rest of transport header, if transport_header_size > 8, ignored
 *   3. VDIF frame, header and payload
 * 
 * Without VTP the datagram is exactly one VDIF frame, and the sequence
 * number is 0.
 */
struct vdif_packet_parser {
  using counter_type = uint64_t;
  static inline constexpr size_t counter_size = sizeof(counter_type);

  bool transport_wrapper = false;
  size_t transport_header_size = VTP_HEADER_SIZE;

  /**
   * @return [header_size, sequence_number]
   * @throw vdif_error truncated if datagram is shorter than transport header
   */
  auto parse(std::span<const std::byte> udp_packet_buffer) const
      -> std::tuple<size_t, counter_type> {
    if (!transport_wrapper) {
      return std::make_tuple(size_t{0}, counter_type{0});
    }
    BOOST_ASSERT(transport_header_size >= counter_size);
    if (udp_packet_buffer.size() < transport_header_size) [[unlikely]] {
      throw vdif_error{errc::truncated,
                       "datagram of " +
                           std::to_string(udp_packet_buffer.size()) +
                           " bytes is shorter than transport header"};
    }
    const counter_type received_counter =
        bit_packing::load_le64(udp_packet_buffer.data());
    return std::make_tuple(transport_header_size, received_counter);
  }

  /** @brief write transport header for @c counter to @c out */
  void write_header(std::span<std::byte> out, counter_type counter) const {
    BOOST_ASSERT(out.size() >= transport_header_size);
    std::fill_n(out.begin(), transport_header_size, std::byte{0});
    bit_packing::store_le64(out.data(), counter);
  }
};

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  //  __VDIFRX_IO_UDP_PACKET_PARSER__
