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
#ifndef __VDIFRX_IO_UDP_FRAME_SENDER__
#define __VDIFRX_IO_UDP_FRAME_SENDER__

#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/udp/packet_parser.hpp"
#include "vdifrx/io/vdif_frame.hpp"

namespace vdifrx {
namespace io {
namespace udp {

/**
 * @brief sends VDIF frames, one per datagram, optionally prefixed by VTP
 *        with sequence number increasing from 0.
 * 
 * ref: https://www.boost.org/doc/libs/1_79_0/doc/html/boost_asio/example/cpp11/multicast/sender.cpp
 */
class frame_sender {
 protected:
  boost::asio::io_context io_context;
  boost::asio::ip::udp::endpoint destination;
  boost::asio::ip::udp::socket socket;
  vdif_packet_parser packet_parser;
  uint64_t sequence_number = 0;
  std::vector<std::byte> buffer;

 public:
  frame_sender(const std::string& address, unsigned short port,
               bool transport_wrapper = false,
               size_t transport_header_size = VTP_HEADER_SIZE)
      : destination{boost::asio::ip::make_address(address), port},
        socket{io_context, destination.protocol()},
        packet_parser{.transport_wrapper = transport_wrapper,
                      .transport_header_size = transport_header_size} {}

  /** @brief send one frame, with transport header if enabled */
  void send_frame(const vdif_frame& frame) {
    const size_t header_size =
        packet_parser.transport_wrapper ? packet_parser.transport_header_size : 0;
    buffer.resize(header_size + frame.frame_bytes());
    if (packet_parser.transport_wrapper) {
      packet_parser.write_header(buffer, sequence_number);
    }
    frame.encode_to(std::span{buffer}.subspan(header_size));
    send_datagram(buffer);
    sequence_number++;
  }

  /** @brief send raw bytes as one datagram */
  void send_datagram(std::span<const std::byte> datagram) {
    try {
      socket.send_to(boost::asio::buffer(datagram.data(), datagram.size()),
                     destination);
    } catch (const boost::system::system_error& e) {
      throw vdif_error{errc::socket_failure,
                       std::string{"send to "} +
                           destination.address().to_string() + ":" +
                           std::to_string(destination.port()) +
                           " failed: " + e.what()};
    }
  }

  auto frames_sent() const noexcept -> uint64_t { return sequence_number; }
};

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_UDP_FRAME_SENDER__
