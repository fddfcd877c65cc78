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
#ifndef __VDIFRX_IO_VDIF_HEADER__
#define __VDIFRX_IO_VDIF_HEADER__

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/bit_packing.hpp"

namespace vdifrx {
namespace io {

/**
 * @brief VDIF frame header, 8 words, or 4 words in legacy mode.
 * 
 * ref: https://vlbi.org/vlbi-standards/vdif/
 * 
 * Words are kept in host order and converted from / to little endian
 * wire bytes in @c decode and @c encode ; each field is accessed by
 * mask and shift of its own bits, mutators reject values wider than the field.
 * Unassigned bits are always zero.
 */
class vdif_header {
 public:
  using vdif_word = uint32_t;
  static inline constexpr size_t vdif_word_size = sizeof(vdif_word);
  static inline constexpr size_t vdif_word_count = 8;
  static inline constexpr size_t legacy_word_count = 4;
  static inline constexpr size_t extended_user_data_count = 4;
  static inline constexpr size_t extended_data_bytes_count = 15;

  static_assert(vdif_word_size * vdif_word_count == VDIF_HEADER_SIZE);
  static_assert(vdif_word_size * legacy_word_count == VDIF_LEGACY_HEADER_SIZE);

 protected:
  struct bit_field {
    size_t word;
    unsigned shift;
    unsigned width;
    const char* name;
  };

  // word 0
  static inline constexpr bit_field invalid_field = {0, 31, 1, "invalid"};
  static inline constexpr bit_field legacy_field = {0, 30, 1, "legacy"};
  static inline constexpr bit_field seconds_field = {0, 0, 30, "seconds_since_epoch"};
  // word 1, bits 30-31 unassigned
  static inline constexpr bit_field reference_epoch_field = {1, 24, 6, "reference_epoch"};
  static inline constexpr bit_field frame_number_field = {1, 0, 24, "frame_number"};
  // word 2
  static inline constexpr bit_field vdif_version_field = {2, 29, 3, "vdif_version"};
  static inline constexpr bit_field log2_channels_field = {2, 24, 5, "log2_channels"};
  static inline constexpr bit_field frame_length_field = {2, 0, 24, "frame_length"};
  // word 3
  static inline constexpr bit_field data_type_field = {3, 31, 1, "data_type"};
  static inline constexpr bit_field bits_per_sample_minus_1_field = {3, 26, 5, "bits_per_sample"};
  static inline constexpr bit_field thread_id_field = {3, 16, 10, "thread_id"};
  static inline constexpr bit_field station_id_field = {3, 0, 16, "station_id"};
  // word 4 - 7, not present in legacy mode
  static inline constexpr bit_field edv_field = {4, 24, 8, "edv"};
  static inline constexpr std::array<bit_field, extended_user_data_count>
      extended_user_data_fields = {bit_field{4, 0, 24, "extended_user_data[0]"},
                                   bit_field{5, 0, 32, "extended_user_data[1]"},
                                   bit_field{6, 0, 32, "extended_user_data[2]"},
                                   bit_field{7, 0, 32, "extended_user_data[3]"}};

  std::array<vdif_word, vdif_word_count> words = {};

  auto get(const bit_field& field) const noexcept -> uint32_t {
    return (words[field.word] >> field.shift) &
           bit_packing::low_bits_mask(field.width);
  }

  void set(const bit_field& field, uint64_t value) {
    const uint32_t mask = bit_packing::low_bits_mask(field.width);
    if (value > mask) [[unlikely]] {
      throw vdif_error{errc::field_overflow,
                       std::string{field.name} + " = " + std::to_string(value) +
                           " does not fit in " + std::to_string(field.width) +
                           " bits"};
    }
    words[field.word] = (words[field.word] & ~(mask << field.shift)) |
                        (static_cast<uint32_t>(value) << field.shift);
  }

  void check_not_legacy(const char* name) const {
    if (legacy()) [[unlikely]] {
      throw vdif_error{errc::field_overflow,
                       std::string{name} + " is not present in legacy header"};
    }
  }

 public:
  /**
   * @brief decode header from wire bytes, bytes after header are ignored
   * @param strict_version if true, vdif_version other than 0 is rejected;
   *                       otherwise it is kept for caller to decide
   * @throw vdif_error truncated, invalid_version
   */
  static auto decode(std::span<const std::byte> bytes,
                     bool strict_version = false) -> vdif_header {
    if (bytes.size() < VDIF_LEGACY_HEADER_SIZE) [[unlikely]] {
      throw vdif_error{errc::truncated,
                       "header needs at least " +
                           std::to_string(VDIF_LEGACY_HEADER_SIZE) +
                           " bytes, got " + std::to_string(bytes.size())};
    }
    vdif_header h;
    for (size_t i = 0; i < legacy_word_count; i++) {
      h.words[i] = bit_packing::load_le32(bytes.data() + i * vdif_word_size);
    }
    if (!h.legacy()) {
      if (bytes.size() < VDIF_HEADER_SIZE) [[unlikely]] {
        throw vdif_error{errc::truncated,
                         "non-legacy header needs " +
                             std::to_string(VDIF_HEADER_SIZE) + " bytes, got " +
                             std::to_string(bytes.size())};
      }
      for (size_t i = legacy_word_count; i < vdif_word_count; i++) {
        h.words[i] = bit_packing::load_le32(bytes.data() + i * vdif_word_size);
      }
    }
    // unassigned bits
    h.words[1] &= bit_packing::low_bits_mask(30);
    if (strict_version && h.vdif_version() != 0) [[unlikely]] {
      throw vdif_error{errc::invalid_version,
                       "vdif_version = " + std::to_string(h.vdif_version())};
    }
    return h;
  }

  /**
   * @brief write @c header_bytes() bytes of wire representation to @c out
   * @throw vdif_error truncated if @c out is too small
   */
  auto encode_to(std::span<std::byte> out) const -> size_t {
    const size_t n = header_bytes();
    if (out.size() < n) [[unlikely]] {
      throw vdif_error{errc::truncated, "header needs " + std::to_string(n) +
                                            " bytes, got " +
                                            std::to_string(out.size())};
    }
    for (size_t i = 0; i < n / vdif_word_size; i++) {
      bit_packing::store_le32(out.data() + i * vdif_word_size, words[i]);
    }
    return n;
  }

  auto encode() const -> std::vector<std::byte> {
    std::vector<std::byte> out(header_bytes());
    encode_to(out);
    return out;
  }

  // ------ accessors ------

  auto invalid() const noexcept -> bool { return get(invalid_field); }
  auto is_valid() const noexcept -> bool { return !invalid(); }
  auto legacy() const noexcept -> bool { return get(legacy_field); }
  auto seconds_since_epoch() const noexcept -> uint32_t { return get(seconds_field); }
  auto reference_epoch() const noexcept -> uint32_t { return get(reference_epoch_field); }
  auto frame_number() const noexcept -> uint32_t { return get(frame_number_field); }
  auto vdif_version() const noexcept -> uint32_t { return get(vdif_version_field); }
  auto log2_channels() const noexcept -> uint32_t { return get(log2_channels_field); }
  auto channels() const noexcept -> uint32_t { return uint32_t{1} << log2_channels(); }

  /** @brief total frame length including header, in units of 8 bytes */
  auto frame_length() const noexcept -> uint32_t { return get(frame_length_field); }
  auto is_complex() const noexcept -> bool { return get(data_type_field); }
  auto bits_per_sample() const noexcept -> uint32_t {
    return get(bits_per_sample_minus_1_field) + 1;
  }
  auto thread_id() const noexcept -> uint32_t { return get(thread_id_field); }
  auto station_id() const noexcept -> uint32_t { return get(station_id_field); }

  /** @brief extended data version, 0 for legacy headers */
  auto edv() const noexcept -> uint32_t { return get(edv_field); }

  /**
   * @brief opaque extended user data, index 0 is 24 bits wide, others 32 bits;
   *        always 0 for legacy headers
   */
  auto extended_user_data(size_t index) const -> uint32_t {
    BOOST_ASSERT(index < extended_user_data_count);
    return get(extended_user_data_fields[index]);
  }

  /** @brief extended data region after EDV, as on wire */
  auto extended_data_bytes() const
      -> std::array<std::byte, extended_data_bytes_count> {
    std::array<std::byte, VDIF_HEADER_SIZE> raw;
    for (size_t i = 0; i < vdif_word_count; i++) {
      bit_packing::store_le32(raw.data() + i * vdif_word_size, words[i]);
    }
    std::array<std::byte, extended_data_bytes_count> out;
    // bytes 16-18 (word 4 without EDV) and 20-31
    std::copy_n(raw.begin() + 16, 3, out.begin());
    std::copy_n(raw.begin() + 20, 12, out.begin() + 3);
    return out;
  }

  /**
   * @brief two character ASCII station code, if station_id holds one.
   *        First character is in the higher byte.
   */
  auto station_code() const -> std::optional<std::string> {
    const char c0 = static_cast<char>((station_id() >> 8) & 0xFF);
    const char c1 = static_cast<char>(station_id() & 0xFF);
    if (std::isprint(static_cast<unsigned char>(c0)) &&
        std::isprint(static_cast<unsigned char>(c1))) {
      return std::string{c0, c1};
    }
    return std::nullopt;
  }

  auto header_bytes() const noexcept -> size_t {
    return legacy() ? VDIF_LEGACY_HEADER_SIZE : VDIF_HEADER_SIZE;
  }

  auto frame_bytes() const noexcept -> size_t {
    return static_cast<size_t>(frame_length()) * VDIF_FRAME_LENGTH_UNIT;
  }

  /**
   * @brief payload length derived from header
   * @throw vdif_error length_mismatch if frame is shorter than its own header
   */
  auto payload_bytes() const -> size_t {
    if (frame_bytes() < header_bytes()) [[unlikely]] {
      throw vdif_error{errc::length_mismatch,
                       "frame length " + std::to_string(frame_bytes()) +
                           " is less than header length " +
                           std::to_string(header_bytes())};
    }
    return frame_bytes() - header_bytes();
  }

  // ------ mutators ------

  auto set_invalid(bool value) -> vdif_header& {
    set(invalid_field, value);
    return *this;
  }

  /** @note entering legacy mode discards extended data */
  auto set_legacy(bool value) -> vdif_header& {
    set(legacy_field, value);
    if (value) {
      for (size_t i = legacy_word_count; i < vdif_word_count; i++) {
        words[i] = 0;
      }
    }
    return *this;
  }

  auto set_seconds_since_epoch(uint64_t value) -> vdif_header& {
    set(seconds_field, value);
    return *this;
  }

  auto set_reference_epoch(uint64_t value) -> vdif_header& {
    set(reference_epoch_field, value);
    return *this;
  }

  auto set_frame_number(uint64_t value) -> vdif_header& {
    set(frame_number_field, value);
    return *this;
  }

  auto set_vdif_version(uint64_t value) -> vdif_header& {
    set(vdif_version_field, value);
    return *this;
  }

  auto set_log2_channels(uint64_t value) -> vdif_header& {
    set(log2_channels_field, value);
    return *this;
  }

  /** @param value total frame length in units of 8 bytes */
  auto set_frame_length(uint64_t value) -> vdif_header& {
    set(frame_length_field, value);
    return *this;
  }

  /** @param byte_count total frame length in bytes, multiple of 8 */
  auto set_frame_bytes(size_t byte_count) -> vdif_header& {
    if (byte_count % VDIF_FRAME_LENGTH_UNIT != 0) [[unlikely]] {
      throw vdif_error{errc::length_mismatch,
                       "frame length " + std::to_string(byte_count) +
                           " is not multiple of " +
                           std::to_string(VDIF_FRAME_LENGTH_UNIT)};
    }
    return set_frame_length(byte_count / VDIF_FRAME_LENGTH_UNIT);
  }

  auto set_complex(bool value) -> vdif_header& {
    set(data_type_field, value);
    return *this;
  }

  /** @param value 1 to 32 */
  auto set_bits_per_sample(uint64_t value) -> vdif_header& {
    if (value == 0) [[unlikely]] {
      throw vdif_error{errc::field_overflow, "bits_per_sample = 0"};
    }
    set(bits_per_sample_minus_1_field, value - 1);
    return *this;
  }

  auto set_thread_id(uint64_t value) -> vdif_header& {
    set(thread_id_field, value);
    return *this;
  }

  auto set_station_id(uint64_t value) -> vdif_header& {
    set(station_id_field, value);
    return *this;
  }

  auto set_station_code(std::string_view code) -> vdif_header& {
    if (code.size() != 2) [[unlikely]] {
      throw vdif_error{errc::field_overflow,
                       "station code \"" + std::string{code} +
                           "\" is not 2 characters"};
    }
    return set_station_id(
        (static_cast<uint32_t>(static_cast<unsigned char>(code[0])) << 8) |
        static_cast<uint32_t>(static_cast<unsigned char>(code[1])));
  }

  auto set_edv(uint64_t value) -> vdif_header& {
    check_not_legacy("edv");
    set(edv_field, value);
    return *this;
  }

  auto set_extended_user_data(size_t index, uint64_t value) -> vdif_header& {
    check_not_legacy("extended_user_data");
    if (index >= extended_user_data_count) [[unlikely]] {
      throw vdif_error{errc::field_overflow,
                       "extended_user_data index " + std::to_string(index) +
                           " out of range"};
    }
    set(extended_user_data_fields[index], value);
    return *this;
  }

  auto set_extended_data_bytes(
      const std::array<std::byte, extended_data_bytes_count>& data)
      -> vdif_header& {
    check_not_legacy("extended data");
    std::array<std::byte, VDIF_HEADER_SIZE> raw;
    for (size_t i = 0; i < vdif_word_count; i++) {
      bit_packing::store_le32(raw.data() + i * vdif_word_size, words[i]);
    }
    std::copy_n(data.begin(), 3, raw.begin() + 16);
    std::copy_n(data.begin() + 3, 12, raw.begin() + 20);
    for (size_t i = legacy_word_count; i < vdif_word_count; i++) {
      words[i] = bit_packing::load_le32(raw.data() + i * vdif_word_size);
    }
    return *this;
  }

  bool operator==(const vdif_header& other) const = default;
};

inline auto operator<<(std::ostream& os, const vdif_header& h)
    -> std::ostream& {
  os << "{invalid = " << h.invalid() << ", legacy = " << h.legacy()
     << ", seconds_since_epoch = " << h.seconds_since_epoch()
     << ", reference_epoch = " << h.reference_epoch()
     << ", frame_number = " << h.frame_number()
     << ", vdif_version = " << h.vdif_version()
     << ", channels = " << h.channels()
     << ", frame_length = " << h.frame_bytes() << " bytes"
     << ", complex = " << h.is_complex()
     << ", bits_per_sample = " << h.bits_per_sample()
     << ", thread_id = " << h.thread_id()
     << ", station_id = " << h.station_id();
  if (auto code = h.station_code(); code.has_value()) {
    os << " (" << code.value() << ")";
  }
  if (!h.legacy()) {
    os << ", edv = " << h.edv();
  }
  os << "}";
  return os;
}

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_VDIF_HEADER__
