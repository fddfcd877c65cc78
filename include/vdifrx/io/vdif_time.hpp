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
#ifndef __VDIFRX_IO_VDIF_TIME__
#define __VDIFRX_IO_VDIF_TIME__

#include <chrono>
#include <cstdint>
#include <string>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/vdif_header.hpp"

namespace vdifrx {
namespace io {

// reference epoch counts half years since 2000-01-01 UTC,
// i.e. even values are 1st January, odd values are 1st July.
// leap seconds are not counted, as std::chrono::system_clock

inline constexpr int reference_epoch_origin_year = 2000;

inline constexpr auto reference_epoch_start(uint32_t reference_epoch)
    -> std::chrono::sys_days {
  const std::chrono::year y{reference_epoch_origin_year +
                            static_cast<int>(reference_epoch / 2)};
  const std::chrono::month m =
      (reference_epoch % 2 == 0) ? std::chrono::January : std::chrono::July;
  return std::chrono::sys_days{y / m / std::chrono::day{1}};
}

/** @brief reference epoch that @c t falls in */
inline auto reference_epoch_of(std::chrono::sys_seconds t) -> uint32_t {
  const auto days = std::chrono::floor<std::chrono::days>(t);
  const std::chrono::year_month_day ymd{days};
  const int year_offset =
      static_cast<int>(ymd.year()) - reference_epoch_origin_year;
  if (year_offset < 0) [[unlikely]] {
    throw vdif_error{errc::out_of_range,
                     "time before 2000-01-01 cannot be represented"};
  }
  return static_cast<uint32_t>(year_offset * 2 +
                               (ymd.month() >= std::chrono::July ? 1 : 0));
}

/** @brief start of second of a frame */
inline auto header_time(const vdif_header& header) -> std::chrono::sys_seconds {
  return std::chrono::sys_seconds{reference_epoch_start(header.reference_epoch())} +
         std::chrono::seconds{header.seconds_since_epoch()};
}

/** @brief start time of a frame, given frames per second of its thread */
inline auto frame_time(const vdif_header& header, uint32_t frames_per_second)
    -> std::chrono::sys_time<std::chrono::nanoseconds> {
  BOOST_ASSERT(frames_per_second > 0);
  const auto offset = std::chrono::nanoseconds{
      static_cast<int64_t>(header.frame_number()) * 1'000'000'000 /
      static_cast<int64_t>(frames_per_second)};
  return std::chrono::sys_time<std::chrono::nanoseconds>{header_time(header)} +
         offset;
}

/**
 * @brief set reference epoch and seconds of @c header to @c t
 * @throw vdif_error out_of_range if before 2000, field_overflow if too late
 */
inline void set_header_time(vdif_header& header, std::chrono::sys_seconds t) {
  const uint32_t epoch = reference_epoch_of(t);
  const auto seconds = t - std::chrono::sys_seconds{reference_epoch_start(epoch)};
  header.set_reference_epoch(epoch).set_seconds_since_epoch(
      static_cast<uint64_t>(seconds.count()));
}

/**
 * ref: https://en.cppreference.com/w/cpp/chrono/duration
 *      https://stackoverflow.com/questions/466321/convert-unix-timestamp-to-julian
 *      https://en.wikipedia.org/wiki/Julian_day
 */
template <typename Rep, typename Period>
inline auto unix_timestamp_to_mjd(std::chrono::duration<Rep, Period> d)
    -> double {
  auto d_in_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d);
  return (d_in_ns.count() / (1.0e9 * 86400.0)) + 2440587.5 - 2400000.5;
}

/** @brief modified julian date of start of second of a frame */
inline auto header_mjd(const vdif_header& header) -> double {
  return unix_timestamp_to_mjd(header_time(header).time_since_epoch());
}

}  // namespace io
}  // namespace vdifrx

#endif  // __VDIFRX_IO_VDIF_TIME__
