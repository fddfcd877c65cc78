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
#ifndef __VDIFRX_IO_BIT_PACKING__
#define __VDIFRX_IO_BIT_PACKING__

// Wire layout of VDIF: a frame is a stream of little endian 32-bit words,
// samples are packed from the least significant bit of each word, and a
// sample never crosses two words; if bits per sample does not divide 32,
// the most significant (32 % bits) bits of each word are unused.
// All byte order and bit order of this library is decided in this file.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

#include "vdifrx/config.hpp"

namespace vdifrx {
namespace io {
namespace bit_packing {

inline constexpr unsigned max_bits_per_sample = 32;

inline auto load_le32(const std::byte* p) noexcept -> uint32_t {
  return (static_cast<uint32_t>(p[0])) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline void store_le32(std::byte* p, uint32_t value) noexcept {
  p[0] = static_cast<std::byte>(value & 0xFF);
  p[1] = static_cast<std::byte>((value >> 8) & 0xFF);
  p[2] = static_cast<std::byte>((value >> 16) & 0xFF);
  p[3] = static_cast<std::byte>((value >> 24) & 0xFF);
}

inline auto load_le64(const std::byte* p) noexcept -> uint64_t {
  return static_cast<uint64_t>(load_le32(p)) |
         (static_cast<uint64_t>(load_le32(p + BYTES_PER_WORD)) << 32);
}

inline void store_le64(std::byte* p, uint64_t value) noexcept {
  store_le32(p, static_cast<uint32_t>(value & 0xFFFFFFFF));
  store_le32(p + BYTES_PER_WORD, static_cast<uint32_t>(value >> 32));
}

/** @brief mask of lowest @c bits bits, @c bits in [0, 32] */
constexpr auto low_bits_mask(unsigned bits) noexcept -> uint32_t {
  return (bits >= 32) ? uint32_t{0xFFFFFFFF} : ((uint32_t{1} << bits) - 1);
}

constexpr auto samples_per_word(unsigned bits) noexcept -> size_t {
  return BITS_PER_WORD / bits;
}

constexpr auto is_valid_bits_per_sample(unsigned bits) noexcept -> bool {
  return 1 <= bits && bits <= max_bits_per_sample;
}

/** @brief count of samples held by @c byte_count bytes, whole words only */
constexpr auto sample_capacity(size_t byte_count, unsigned bits) noexcept
    -> size_t {
  return (byte_count / BYTES_PER_WORD) * samples_per_word(bits);
}

/** @brief bytes needed to hold @c sample_count samples, rounded up to whole words */
constexpr auto bytes_for_samples(size_t sample_count, unsigned bits) noexcept
    -> size_t {
  const size_t spw = samples_per_word(bits);
  return ((sample_count + spw - 1) / spw) * BYTES_PER_WORD;
}

/** @brief read code of sample @c index , without bound check */
inline auto extract(const std::byte* data, size_t index, unsigned bits) noexcept
    -> uint32_t {
  const size_t spw = samples_per_word(bits);
  const uint32_t word = load_le32(data + (index / spw) * BYTES_PER_WORD);
  const unsigned shift = static_cast<unsigned>(index % spw) * bits;
  // shift == 32 never happens, as slot < spw
  return (word >> shift) & low_bits_mask(bits);
}

/** @brief write code of sample @c index , other samples of the word are kept */
inline void insert(std::byte* data, size_t index, unsigned bits,
                   uint32_t code) noexcept {
  const size_t spw = samples_per_word(bits);
  std::byte* p = data + (index / spw) * BYTES_PER_WORD;
  const unsigned shift = static_cast<unsigned>(index % spw) * bits;
  const uint32_t mask = low_bits_mask(bits) << shift;
  const uint32_t word = (load_le32(p) & ~mask) | ((code << shift) & mask);
  store_le32(p, word);
}

/**
 * @brief random access iterator decoding samples from packed bytes on demand.
 *        Value is the unsigned code of the sample.
 */
class sample_iterator {
 public:
  using iterator_category = std::random_access_iterator_tag;
  using iterator_concept = std::random_access_iterator_tag;
  using value_type = uint32_t;
  using difference_type = std::ptrdiff_t;
  using reference = uint32_t;
  using pointer = void;

 protected:
  const std::byte* data = nullptr;
  size_t index = 0;
  unsigned bits = 1;

 public:
  sample_iterator() = default;
  sample_iterator(const std::byte* data_, size_t index_, unsigned bits_)
      : data{data_}, index{index_}, bits{bits_} {}

  auto operator*() const noexcept -> reference {
    return extract(data, index, bits);
  }
  auto operator[](difference_type n) const noexcept -> reference {
    return extract(data, index + n, bits);
  }

  auto operator++() noexcept -> sample_iterator& {
    ++index;
    return *this;
  }
  auto operator++(int) noexcept -> sample_iterator {
    auto old = *this;
    ++index;
    return old;
  }
  auto operator--() noexcept -> sample_iterator& {
    --index;
    return *this;
  }
  auto operator--(int) noexcept -> sample_iterator {
    auto old = *this;
    --index;
    return old;
  }
  auto operator+=(difference_type n) noexcept -> sample_iterator& {
    index += n;
    return *this;
  }
  auto operator-=(difference_type n) noexcept -> sample_iterator& {
    index -= n;
    return *this;
  }
  friend auto operator+(sample_iterator it, difference_type n) noexcept
      -> sample_iterator {
    return it += n;
  }
  friend auto operator+(difference_type n, sample_iterator it) noexcept
      -> sample_iterator {
    return it += n;
  }
  friend auto operator-(sample_iterator it, difference_type n) noexcept
      -> sample_iterator {
    return it -= n;
  }
  friend auto operator-(const sample_iterator& a,
                        const sample_iterator& b) noexcept -> difference_type {
    return static_cast<difference_type>(a.index) -
           static_cast<difference_type>(b.index);
  }
  friend auto operator==(const sample_iterator& a,
                         const sample_iterator& b) noexcept -> bool {
    return a.index == b.index;
  }
  friend auto operator<=>(const sample_iterator& a,
                          const sample_iterator& b) noexcept
      -> std::strong_ordering {
    return a.index <=> b.index;
  }
};

/**
 * @brief lazy sequence of sample codes over a packed byte buffer;
 *        nothing is decoded until an element is accessed.
 * @note does not own the buffer
 */
class sample_view {
 protected:
  std::span<const std::byte> bytes;
  unsigned bits = 1;
  size_t count = 0;

 public:
  sample_view() = default;
  sample_view(std::span<const std::byte> bytes_, unsigned bits_)
      : bytes{bytes_}, bits{bits_}, count{sample_capacity(bytes_.size(), bits_)} {}

  auto begin() const noexcept -> sample_iterator {
    return sample_iterator{bytes.data(), 0, bits};
  }
  auto end() const noexcept -> sample_iterator {
    return sample_iterator{bytes.data(), count, bits};
  }
  auto size() const noexcept -> size_t { return count; }
  auto empty() const noexcept -> bool { return count == 0; }
  auto bits_per_sample() const noexcept -> unsigned { return bits; }
  auto operator[](size_t i) const noexcept -> uint32_t {
    return extract(bytes.data(), i, bits);
  }
};

}  // namespace bit_packing
}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_BIT_PACKING__
