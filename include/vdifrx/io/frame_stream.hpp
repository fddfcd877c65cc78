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
#ifndef __VDIFRX_IO_FRAME_STREAM__
#define __VDIFRX_IO_FRAME_STREAM__

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/bit_packing.hpp"
#include "vdifrx/io/vdif_frame.hpp"
#include "vdifrx/io/vdif_header.hpp"

namespace vdifrx {
namespace io {

/**
 * @brief reads VDIF frames one by one from a byte stream,
 *        e.g. std::ifstream or boost::asio::ip::tcp::iostream
 */
class frame_reader {
 protected:
  std::istream& stream;
  /** @brief 0 to use frame length in each header */
  size_t frame_size;
  bool strict_version;
  std::vector<std::byte> buffer;
  size_t frame_count = 0;

  /** @return bytes actually read */
  auto read_into(std::byte* dst, size_t n) -> size_t {
    stream.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(stream.gcount());
  }

  auto truncated_error(size_t expected, size_t got) const -> vdif_error {
    return vdif_error{errc::truncated,
                      "frame " + std::to_string(frame_count) + ": expected " +
                          std::to_string(expected) + " bytes, got " +
                          std::to_string(got)};
  }

 public:
  explicit frame_reader(std::istream& stream_, size_t frame_size_ = 0,
                        bool strict_version_ = false)
      : stream{stream_},
        frame_size{frame_size_},
        strict_version{strict_version_} {}

  /**
   * @brief read next frame
   * @return frame, or std::nullopt at end of stream
   * @throw vdif_error truncated if stream ends within a frame,
   *        or other decoding errors
   */
  auto read_frame() -> std::optional<vdif_frame> {
    if (frame_size > 0) {
      buffer.resize(frame_size);
      const size_t n = read_into(buffer.data(), frame_size);
      if (n == 0) {
        return std::nullopt;
      }
      if (n < frame_size) [[unlikely]] {
        throw truncated_error(frame_size, n);
      }
    } else {
      buffer.resize(VDIF_LEGACY_HEADER_SIZE);
      const size_t n = read_into(buffer.data(), VDIF_LEGACY_HEADER_SIZE);
      if (n == 0) {
        return std::nullopt;
      }
      if (n < VDIF_LEGACY_HEADER_SIZE) [[unlikely]] {
        throw truncated_error(VDIF_LEGACY_HEADER_SIZE, n);
      }
      // legacy bit (word 0, bit 30) decides header length
      const bool legacy =
          ((bit_packing::load_le32(buffer.data()) >> 30) & 1) != 0;
      if (!legacy) {
        buffer.resize(VDIF_HEADER_SIZE);
        const size_t m = read_into(buffer.data() + VDIF_LEGACY_HEADER_SIZE,
                                   VDIF_HEADER_SIZE - VDIF_LEGACY_HEADER_SIZE);
        if (m < VDIF_HEADER_SIZE - VDIF_LEGACY_HEADER_SIZE) [[unlikely]] {
          throw truncated_error(VDIF_HEADER_SIZE, VDIF_LEGACY_HEADER_SIZE + m);
        }
      }
      const vdif_header header = vdif_header::decode(buffer, strict_version);
      const size_t header_size = header.header_bytes();
      const size_t payload_size = header.payload_bytes();
      buffer.resize(header_size + payload_size);
      const size_t m = read_into(buffer.data() + header_size, payload_size);
      if (m < payload_size) [[unlikely]] {
        throw truncated_error(header_size + payload_size, header_size + m);
      }
    }
    vdif_frame frame = vdif_frame::from_bytes(buffer, strict_version);
    frame_count++;
    return frame;
  }

  auto frames_read() const noexcept -> size_t { return frame_count; }
};

/**
 * @brief writes VDIF frames one by one to a byte stream
 */
class frame_writer {
 protected:
  std::ostream& stream;
  std::vector<std::byte> buffer;
  size_t frame_count = 0;

 public:
  explicit frame_writer(std::ostream& stream_) : stream{stream_} {}

  void write_frame(const vdif_frame& frame) {
    buffer.resize(frame.frame_bytes());
    frame.encode_to(buffer);
    write_bytes(buffer);
    frame_count++;
  }

  void write_bytes(std::span<const std::byte> bytes) {
    stream.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
    if (!stream) [[unlikely]] {
      throw std::runtime_error{"[frame_writer] failed to write frame " +
                               std::to_string(frame_count)};
    }
  }

  void flush() { stream.flush(); }

  auto frames_written() const noexcept -> size_t { return frame_count; }
};

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_FRAME_STREAM__
