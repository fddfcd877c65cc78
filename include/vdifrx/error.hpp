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
#ifndef __VDIFRX_ERROR__
#define __VDIFRX_ERROR__

#include <stdexcept>
#include <string>
#include <string_view>

namespace vdifrx {

/**
 * @brief Kinds of failure reported by codecs, frames and the receiver.
 *
 * Full / Empty of the ring buffer are not listed here: they are ordinary
 * return values of @c try_push and @c try_pop .
 */
enum class errc : int {
  /** @brief not enough bytes for header or payload */
  truncated = 1,
  /** @brief vdif_version other than 0 and strict decoding requested */
  invalid_version,
  /** @brief value does not fit the bit width of the header field */
  field_overflow,
  /** @brief payload length disagrees with header, or does not hold whole samples */
  length_mismatch,
  /** @brief sample value cannot be represented with given bits per sample */
  out_of_range,
  /** @brief blocking operation exceeded its bound */
  timeout,
  /** @brief unrecoverable transport error */
  socket_failure,
  /** @brief operation does not apply to payload layout, e.g. complex access to real data */
  layout_mismatch,
  /** @brief internal invariant or precondition does not hold */
  assertion_failed
};

constexpr std::string_view errc_name(errc code) {
  switch (code) {
    case errc::truncated:
      return "truncated";
    case errc::invalid_version:
      return "invalid_version";
    case errc::field_overflow:
      return "field_overflow";
    case errc::length_mismatch:
      return "length_mismatch";
    case errc::out_of_range:
      return "out_of_range";
    case errc::timeout:
      return "timeout";
    case errc::socket_failure:
      return "socket_failure";
    case errc::layout_mismatch:
      return "layout_mismatch";
    case errc::assertion_failed:
      return "assertion_failed";
    default:
      return "<unknown>";
  }
}

class vdif_error : public std::runtime_error {
 protected:
  errc error_code;

 public:
  vdif_error(errc code, const std::string& message)
      : std::runtime_error{std::string{"["} + std::string{errc_name(code)} +
                           "] " + message},
        error_code{code} {}

  auto code() const noexcept -> errc { return error_code; }
};

}  // namespace vdifrx

#endif  // __VDIFRX_ERROR__
