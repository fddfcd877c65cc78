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
#ifndef __VDIFRX_IO_VDIF_FRAME__
#define __VDIFRX_IO_VDIF_FRAME__

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/bit_packing.hpp"
#include "vdifrx/io/vdif_header.hpp"
#include "vdifrx/io/vdif_payload.hpp"

namespace vdifrx {
namespace io {

/**
 * @brief a VDIF frame, header and payload bytes owned together.
 * 
 * Frames are only built by the static constructors or @c assign_from_bytes ,
 * there is no mutable access to header or payload afterwards.
 * Payload is kept packed; samples are decoded only when asked for.
 */
class vdif_frame {
 protected:
  vdif_header frame_header;
  std::vector<std::byte> payload_buffer;

  static void check_payload_size(const vdif_header& header,
                                 size_t payload_size) {
    const size_t expected = header.payload_bytes();
    if (payload_size != expected) [[unlikely]] {
      throw vdif_error{errc::length_mismatch,
                       "header declares " + std::to_string(expected) +
                           " payload bytes, got " +
                           std::to_string(payload_size)};
    }
  }

 public:
  vdif_frame() = default;

  /**
   * @brief compose a frame from a header and its payload
   * @throw vdif_error length_mismatch if payload length disagrees with header
   */
  static auto from_parts(const vdif_header& header,
                         std::vector<std::byte> payload) -> vdif_frame {
    check_payload_size(header, payload.size());
    vdif_frame frame;
    frame.frame_header = header;
    frame.payload_buffer = std::move(payload);
    return frame;
  }

  static auto from_parts(const vdif_header& header,
                         std::span<const std::byte> payload) -> vdif_frame {
    return from_parts(header,
                      std::vector<std::byte>(payload.begin(), payload.end()));
  }

  /**
   * @brief parse a whole frame from wire bytes
   * @throw vdif_error truncated if @c wire is shorter than declared frame length,
   *                   length_mismatch if longer, or if header is inconsistent
   */
  static auto from_bytes(std::span<const std::byte> wire,
                         bool strict_version = false) -> vdif_frame {
    vdif_frame frame;
    frame.assign_from_bytes(wire, strict_version);
    return frame;
  }

  /**
   * @brief encode path: pack signed sample values under @c header
   * @throw vdif_error length_mismatch, out_of_range
   */
  static auto from_samples(
      const vdif_header& header, std::span<const int32_t> values,
      out_of_range_policy policy = out_of_range_policy::reject) -> vdif_frame {
    const auto layout = payload_layout::from_header(header);
    std::vector<std::byte> payload(header.payload_bytes());
    encode_payload_signed_to(values, layout, payload, policy);
    return from_parts(header, std::move(payload));
  }

  /** @brief encode path: pack unsigned codes under @c header */
  static auto from_codes(
      const vdif_header& header, std::span<const uint32_t> codes,
      out_of_range_policy policy = out_of_range_policy::reject) -> vdif_frame {
    const auto layout = payload_layout::from_header(header);
    std::vector<std::byte> payload(header.payload_bytes());
    encode_payload_to(codes, layout, payload, policy);
    return from_parts(header, std::move(payload));
  }

  /**
   * @brief replace content with frame parsed from @c wire ,
   *        reusing payload storage already allocated.
   * @note on exception, content of this frame is unspecified but valid
   */
  void assign_from_bytes(std::span<const std::byte> wire,
                         bool strict_version = false) {
    const vdif_header header = vdif_header::decode(wire, strict_version);
    const size_t frame_size = header.frame_bytes();
    const size_t payload_size = header.payload_bytes();
    if (wire.size() < frame_size) [[unlikely]] {
      throw vdif_error{errc::truncated,
                       "header declares " + std::to_string(frame_size) +
                           " bytes, got " + std::to_string(wire.size())};
    }
    if (wire.size() > frame_size) [[unlikely]] {
      throw vdif_error{errc::length_mismatch,
                       "header declares " + std::to_string(frame_size) +
                           " bytes, got " + std::to_string(wire.size())};
    }
    const auto payload = wire.subspan(header.header_bytes(), payload_size);
    frame_header = header;
    payload_buffer.assign(payload.begin(), payload.end());
  }

  auto header() const noexcept -> const vdif_header& { return frame_header; }

  /** @brief raw payload bytes, zero-copy */
  auto payload() const noexcept -> std::span<const std::byte> {
    return payload_buffer;
  }

  auto layout() const -> payload_layout {
    return payload_layout::from_header(frame_header);
  }

  /** @brief lazy view of unsigned sample codes */
  auto samples() const -> bit_packing::sample_view {
    return bit_packing::sample_view{payload(), frame_header.bits_per_sample()};
  }

  auto decode_codes() const -> std::vector<uint32_t> {
    return decode_payload(payload(), layout());
  }

  auto decode_samples() const -> std::vector<int32_t> {
    return decode_payload_signed(payload(), layout());
  }

  auto decode_complex_samples() const -> std::vector<complex_sample> {
    return decode_payload_complex(payload(), layout());
  }

  auto frame_bytes() const noexcept -> size_t {
    return frame_header.header_bytes() + payload_buffer.size();
  }

  auto empty() const noexcept -> bool { return payload_buffer.empty(); }

  /**
   * @brief write wire representation into @c out
   * @return bytes written
   */
  auto encode_to(std::span<std::byte> out) const -> size_t {
    if (out.size() < frame_bytes()) [[unlikely]] {
      throw vdif_error{errc::truncated, "frame needs " +
                                            std::to_string(frame_bytes()) +
                                            " bytes, got " +
                                            std::to_string(out.size())};
    }
    const size_t n = frame_header.encode_to(out);
    std::copy(payload_buffer.begin(), payload_buffer.end(), out.begin() + n);
    return n + payload_buffer.size();
  }

  auto to_bytes() const -> std::vector<std::byte> {
    std::vector<std::byte> out(frame_bytes());
    encode_to(out);
    return out;
  }

  bool operator==(const vdif_frame& other) const = default;
};

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_VDIF_FRAME__
