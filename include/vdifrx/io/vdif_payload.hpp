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
#ifndef __VDIFRX_IO_VDIF_PAYLOAD__
#define __VDIFRX_IO_VDIF_PAYLOAD__

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/bit_packing.hpp"
#include "vdifrx/io/vdif_header.hpp"

namespace vdifrx {
namespace io {

/**
 * @brief how samples are packed in a payload.
 *        A time sample is @c channels components, or twice that if complex;
 *        components are channel interleaved, real part before imaginary part.
 */
struct payload_layout {
  unsigned bits_per_sample = 2;
  unsigned channels = 1;
  bool is_complex = false;

  static auto from_header(const vdif_header& header) -> payload_layout {
    return payload_layout{.bits_per_sample = header.bits_per_sample(),
                          .channels = header.channels(),
                          .is_complex = header.is_complex()};
  }

  auto components_per_time_sample() const noexcept -> size_t {
    return static_cast<size_t>(channels) * (is_complex ? 2 : 1);
  }

  /** @brief offset of offset-binary, code = value + offset */
  auto offset() const noexcept -> int64_t {
    return int64_t{1} << (bits_per_sample - 1);
  }

  auto max_code() const noexcept -> uint32_t {
    return bit_packing::low_bits_mask(bits_per_sample);
  }
};

enum class out_of_range_policy { reject, clamp };

struct complex_sample {
  int32_t re;
  int32_t im;

  bool operator==(const complex_sample& other) const = default;
};

namespace detail {

inline void check_layout(const payload_layout& layout) {
  if (!bit_packing::is_valid_bits_per_sample(layout.bits_per_sample))
      [[unlikely]] {
    throw vdif_error{errc::field_overflow,
                     "bits_per_sample = " +
                         std::to_string(layout.bits_per_sample)};
  }
  if (layout.channels == 0) [[unlikely]] {
    throw vdif_error{errc::length_mismatch, "channels = 0"};
  }
}

inline void check_whole_time_samples(size_t component_count,
                                     const payload_layout& layout) {
  if (component_count % layout.components_per_time_sample() != 0)
      [[unlikely]] {
    throw vdif_error{errc::length_mismatch,
                     std::to_string(component_count) +
                         " components is not multiple of " +
                         std::to_string(layout.components_per_time_sample())};
  }
}

inline auto clamp_or_reject(int64_t value, int64_t min, int64_t max,
                            out_of_range_policy policy) -> int64_t {
  if (value < min || value > max) [[unlikely]] {
    if (policy == out_of_range_policy::clamp) {
      return std::clamp(value, min, max);
    }
    throw vdif_error{errc::out_of_range,
                     "sample " + std::to_string(value) + " not in [" +
                         std::to_string(min) + ", " + std::to_string(max) +
                         "]"};
  }
  return value;
}

/**
 * @brief pack codes word by word, @c get_code(i) returns code of sample i
 *        already checked to fit.
 */
template <typename GetCode>
inline void pack_words(std::span<std::byte> out, size_t sample_count,
                       unsigned bits, GetCode&& get_code) {
  const size_t spw = bit_packing::samples_per_word(bits);
  const size_t word_count = sample_count / spw;
  size_t i = 0;
  for (size_t w = 0; w < word_count; w++) {
    uint32_t word = 0;
    for (size_t slot = 0; slot < spw; slot++, i++) {
      word |= get_code(i) << (slot * bits);
    }
    bit_packing::store_le32(out.data() + w * BYTES_PER_WORD, word);
  }
}

template <typename Consume>
inline void unpack_words(std::span<const std::byte> bytes, unsigned bits,
                         Consume&& consume) {
  const size_t spw = bit_packing::samples_per_word(bits);
  const uint32_t mask = bit_packing::low_bits_mask(bits);
  const size_t word_count = bytes.size() / BYTES_PER_WORD;
  for (size_t w = 0; w < word_count; w++) {
    const uint32_t word =
        bit_packing::load_le32(bytes.data() + w * BYTES_PER_WORD);
    for (size_t slot = 0; slot < spw; slot++) {
      consume((word >> (slot * bits)) & mask);
    }
  }
}

}  // namespace detail

/**
 * @brief count of sample components in a payload of @c byte_count bytes
 * @throw vdif_error length_mismatch if payload is not whole words,
 *        or does not hold whole time samples
 */
inline auto payload_component_count(size_t byte_count,
                                    const payload_layout& layout) -> size_t {
  detail::check_layout(layout);
  if (byte_count % BYTES_PER_WORD != 0) [[unlikely]] {
    throw vdif_error{errc::length_mismatch,
                     "payload of " + std::to_string(byte_count) +
                         " bytes is not whole 32-bit words"};
  }
  const size_t count =
      bit_packing::sample_capacity(byte_count, layout.bits_per_sample);
  detail::check_whole_time_samples(count, layout);
  return count;
}

/**
 * @brief bytes needed for @c component_count sample components
 * @throw vdif_error length_mismatch if samples do not fill whole words,
 *        or are not whole time samples
 */
inline auto payload_bytes_for(size_t component_count,
                              const payload_layout& layout) -> size_t {
  detail::check_layout(layout);
  detail::check_whole_time_samples(component_count, layout);
  const size_t spw = bit_packing::samples_per_word(layout.bits_per_sample);
  if (component_count % spw != 0) [[unlikely]] {
    throw vdif_error{errc::length_mismatch,
                     std::to_string(component_count) +
                         " samples do not fill whole words of " +
                         std::to_string(spw) + " samples"};
  }
  return component_count / spw * BYTES_PER_WORD;
}

// ------ decode ------

/** @brief unsigned codes of every sample component, in wire order */
inline auto decode_payload(std::span<const std::byte> bytes,
                           const payload_layout& layout)
    -> std::vector<uint32_t> {
  std::vector<uint32_t> out;
  out.reserve(payload_component_count(bytes.size(), layout));
  detail::unpack_words(bytes, layout.bits_per_sample,
                       [&](uint32_t code) { out.push_back(code); });
  return out;
}

/** @brief offset binary decoded values, value = code - 2^(bits-1) */
inline auto decode_payload_signed(std::span<const std::byte> bytes,
                                  const payload_layout& layout)
    -> std::vector<int32_t> {
  std::vector<int32_t> out;
  out.reserve(payload_component_count(bytes.size(), layout));
  const int64_t offset = layout.offset();
  detail::unpack_words(bytes, layout.bits_per_sample, [&](uint32_t code) {
    out.push_back(static_cast<int32_t>(static_cast<int64_t>(code) - offset));
  });
  return out;
}

/** @brief complex pairs of offset binary values, channel interleaved */
inline auto decode_payload_complex(std::span<const std::byte> bytes,
                                   const payload_layout& layout)
    -> std::vector<complex_sample> {
  if (!layout.is_complex) [[unlikely]] {
    throw vdif_error{errc::layout_mismatch,
                     "complex samples requested from a real payload"};
  }
  const std::vector<int32_t> values = decode_payload_signed(bytes, layout);
  std::vector<complex_sample> out;
  out.reserve(values.size() / 2);
  for (size_t i = 0; i + 1 < values.size(); i += 2) {
    out.push_back(complex_sample{.re = values[i], .im = values[i + 1]});
  }
  return out;
}

// ------ encode ------

/**
 * @brief pack unsigned codes into @c out , which must be exactly as long as needed
 * @throw vdif_error length_mismatch, out_of_range (if policy is reject)
 */
inline void encode_payload_to(std::span<const uint32_t> codes,
                              const payload_layout& layout,
                              std::span<std::byte> out,
                              out_of_range_policy policy =
                                  out_of_range_policy::reject) {
  const size_t byte_count = payload_bytes_for(codes.size(), layout);
  if (out.size() != byte_count) [[unlikely]] {
    throw vdif_error{errc::length_mismatch,
                     std::to_string(codes.size()) + " samples need " +
                         std::to_string(byte_count) + " bytes, buffer has " +
                         std::to_string(out.size())};
  }
  const int64_t max_code = layout.max_code();
  detail::pack_words(out, codes.size(), layout.bits_per_sample,
                     [&](size_t i) -> uint32_t {
                       return static_cast<uint32_t>(detail::clamp_or_reject(
                           codes[i], 0, max_code, policy));
                     });
}

inline auto encode_payload(std::span<const uint32_t> codes,
                           const payload_layout& layout,
                           out_of_range_policy policy =
                               out_of_range_policy::reject)
    -> std::vector<std::byte> {
  std::vector<std::byte> out(payload_bytes_for(codes.size(), layout));
  encode_payload_to(codes, layout, out, policy);
  return out;
}

/**
 * @brief pack signed values as offset binary into @c out
 * @throw vdif_error length_mismatch, out_of_range (if policy is reject)
 */
inline void encode_payload_signed_to(std::span<const int32_t> values,
                                     const payload_layout& layout,
                                     std::span<std::byte> out,
                                     out_of_range_policy policy =
                                         out_of_range_policy::reject) {
  const size_t byte_count = payload_bytes_for(values.size(), layout);
  if (out.size() != byte_count) [[unlikely]] {
    throw vdif_error{errc::length_mismatch,
                     std::to_string(values.size()) + " samples need " +
                         std::to_string(byte_count) + " bytes, buffer has " +
                         std::to_string(out.size())};
  }
  const int64_t offset = layout.offset();
  detail::pack_words(out, values.size(), layout.bits_per_sample,
                     [&](size_t i) -> uint32_t {
                       const int64_t v = detail::clamp_or_reject(
                           values[i], -offset, offset - 1, policy);
                       return static_cast<uint32_t>(v + offset);
                     });
}

inline auto encode_payload_signed(std::span<const int32_t> values,
                                  const payload_layout& layout,
                                  out_of_range_policy policy =
                                      out_of_range_policy::reject)
    -> std::vector<std::byte> {
  std::vector<std::byte> out(payload_bytes_for(values.size(), layout));
  encode_payload_signed_to(values, layout, out, policy);
  return out;
}

inline auto encode_payload_complex(std::span<const complex_sample> samples,
                                   const payload_layout& layout,
                                   out_of_range_policy policy =
                                       out_of_range_policy::reject)
    -> std::vector<std::byte> {
  if (!layout.is_complex) [[unlikely]] {
    throw vdif_error{errc::layout_mismatch,
                     "complex samples given for a real payload"};
  }
  std::vector<int32_t> values;
  values.reserve(samples.size() * 2);
  for (const auto& s : samples) {
    values.push_back(s.re);
    values.push_back(s.im);
  }
  return encode_payload_signed(values, layout, policy);
}

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_VDIF_PAYLOAD__
