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
#ifndef __VDIFRX_IO_UDP_RECVMMSG_PACKET_PROVIDER__
#define __VDIFRX_IO_UDP_RECVMMSG_PACKET_PROVIDER__

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/udp/udp_common.hpp"

namespace vdifrx {
namespace io {
namespace udp {

/**
 * @brief Receive UDP packets in batches using recvmmsg.
 * 
 * @c receive_batch blocks until at least one datagram arrives or
 * receive timeout elapses, then returns every datagram already queued,
 * up to batch size.
 */
class recvmmsg_packet_provider {
 public:
  /** Alignment: 2MB, huge page size */
  static constexpr size_t buffer_alignment = 1 << 21;

 protected:
  struct free_deleter {
    void operator()(std::byte* p) const noexcept { std::free(p); }
  };

  socket_wrapper sock;
  size_t batch_size;
  size_t max_datagram_size;
  std::unique_ptr<std::byte, free_deleter> packet_buffer;
  std::vector<iovec> iovecs;
  std::vector<mmsghdr> msgs;
  std::vector<sockaddr_in> sock_from;
  /** @brief count of datagrams of last batch */
  size_t n_packet = 0;

 public:
  recvmmsg_packet_provider(const std::string& address, unsigned short port,
                           size_t batch_size_, size_t max_datagram_size_,
                           std::chrono::milliseconds receive_timeout)
      : batch_size{std::max(batch_size_, size_t{1})},
        max_datagram_size{max_datagram_size_} {
    {
      sockaddr_in servaddr = {};
      servaddr.sin_family = AF_INET;
      servaddr.sin_port = htons(port);
      if (inet_pton(AF_INET, address.c_str(), &servaddr.sin_addr) != 1)
          [[unlikely]] {
        throw vdif_error{errc::socket_failure,
                         "invalid IPv4 address \"" + address + "\""};
      }
      const int bind_ret = bind(
          sock.sock, reinterpret_cast<sockaddr*>(&servaddr), sizeof(servaddr));
      if (bind_ret < 0) [[unlikely]] {
        std::string msg =
            std::string{"Bind to "} + address + ":" + std::to_string(int{port});
        throw vdif_error{errc::socket_failure,
                         msg + " failed: " + std::strerror(errno)};
      }
      // maximize socket receive buffer size
      const int n = std::numeric_limits<int>::max();
      if (setsockopt(sock.sock, SOL_SOCKET, SO_RCVBUF, &n, sizeof(n)) < 0)
          [[unlikely]] {
        VDIFRX_LOGW << " [recvmmsg_packet_provider] "
                    << "failed to set SO_RCVBUF: " << std::strerror(errno)
                    << vdifrx::endl;
      }
      // receive timeout bounds shutdown latency
      const auto timeout_us =
          std::chrono::duration_cast<std::chrono::microseconds>(receive_timeout)
              .count();
      timeval tv = {};
      tv.tv_sec = timeout_us / 1000000;
      tv.tv_usec = timeout_us % 1000000;
      if (tv.tv_sec == 0 && tv.tv_usec == 0) {
        // 0 means blocking forever
        tv.tv_usec = 1;
      }
      if (setsockopt(sock.sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
          [[unlikely]] {
        throw vdif_error{errc::socket_failure,
                         std::string{"failed to set SO_RCVTIMEO: "} +
                             std::strerror(errno)};
      }
    }

    // allocate packet buffer & advise hugepage
    const size_t required_size = batch_size * max_datagram_size;
    const size_t packet_buffer_size =
        (required_size + buffer_alignment - 1) / buffer_alignment *
        buffer_alignment;
    packet_buffer.reset(reinterpret_cast<std::byte*>(
        std::aligned_alloc(buffer_alignment, packet_buffer_size)));
    if (!packet_buffer) [[unlikely]] {
      throw std::bad_alloc{};
    }
    madvise(packet_buffer.get(), packet_buffer_size, MADV_HUGEPAGE);

    // prepare for recvmmsg
    iovecs.resize(batch_size);
    msgs.resize(batch_size);
    sock_from.resize(batch_size);
    for (size_t i = 0; i < batch_size; i++) {
      iovecs.at(i) = {.iov_base = packet_buffer.get() + i * max_datagram_size,
                      .iov_len = max_datagram_size};
    }
    reset_headers();
  }

  /**
   * @brief Receive a batch of datagrams
   * @return count of datagrams received, 0 if timeout or interrupted
   * @throw vdif_error socket_failure on other errors
   */
  auto receive_batch() -> size_t {
    reset_headers();
    const int ret = recvmmsg(sock.sock, msgs.data(),
                             static_cast<unsigned int>(batch_size),
                             MSG_WAITFORONE, nullptr);
    if (ret < 0) [[unlikely]] {
      const int err = errno;
      n_packet = 0;
      if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
        return 0;
      }
      throw vdif_error{errc::socket_failure,
                       std::string{"recvmmsg failed: "} + std::strerror(err)};
    }
    n_packet = static_cast<size_t>(ret);
    return n_packet;
  }

  /** @brief view of datagram @c i of last batch; memory owned by this provider */
  auto datagram(size_t i) const -> std::span<const std::byte> {
    BOOST_ASSERT(i < n_packet);
    const std::byte* ptr = packet_buffer.get() + i * max_datagram_size;
#if __has_builtin(__builtin_prefetch)
    __builtin_prefetch(ptr, /* rw = read */ 0, /* locality = no */ 0);
#endif
    return std::span{ptr, std::min(size_t{msgs[i].msg_len}, max_datagram_size)};
  }

  /** @brief datagram @c i was longer than buffer and has been cut */
  auto truncated(size_t i) const -> bool {
    BOOST_ASSERT(i < n_packet);
    return (msgs[i].msg_hdr.msg_flags & MSG_TRUNC) != 0;
  }

  auto packet_count() const noexcept -> size_t { return n_packet; }

  /** @brief port actually bound, useful if bound to port 0 */
  auto local_port() const -> unsigned short {
    sockaddr_in addr = {};
    socklen_t len = sizeof(addr);
    if (getsockname(sock.sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0)
        [[unlikely]] {
      throw vdif_error{errc::socket_failure,
                       std::string{"getsockname failed: "} +
                           std::strerror(errno)};
    }
    return ntohs(addr.sin_port);
  }

 protected:
  // kernel writes msg_len, msg_namelen and msg_flags in each call
  void reset_headers() {
    for (size_t i = 0; i < batch_size; i++) {
      msgs.at(i) = {.msg_hdr = {.msg_name = &sock_from.at(i),
                                .msg_namelen = sizeof(decltype(sock_from[0])),
                                .msg_iov = &iovecs.at(i),
                                .msg_iovlen = 1,
                                .msg_control = {},
                                .msg_controllen = {},
                                .msg_flags = {}},
                    .msg_len = {}};
    }
  }
};

}  // namespace udp
}  // namespace io
}  // namespace vdifrx

#endif  //  __VDIFRX_IO_UDP_RECVMMSG_PACKET_PROVIDER__
