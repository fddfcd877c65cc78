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
#ifndef __VDIFRX_UTIL_ASSERT__
#define __VDIFRX_UTIL_ASSERT__

#ifndef BOOST_ENABLE_ASSERT_HANDLER
#define BOOST_ENABLE_ASSERT_HANDLER
#endif
#include <boost/assert.hpp>
// ---
#include <boost/stacktrace.hpp>
#include <string>

#include "vdifrx/error.hpp"
#include "vdifrx/log/log.hpp"

namespace vdifrx {
namespace util {

/** @brief "assertion `expr` failed[: msg] in function at file:line" */
inline auto assertion_message(char const* expr, char const* msg,
                              char const* function, char const* file,
                              long line) -> std::string {
  std::string message = std::string{"assertion `"} + expr + "` failed";
  if (msg != nullptr) {
    message += std::string{": "} + msg;
  }
  message += std::string{" in "} + function + " at " + file + ":" +
             std::to_string(line);
  return message;
}

/**
 * @brief failed assertions are reported like other errors of vdifrx, so the
 *        receiver thread can store and re-throw it to its owner.
 */
[[noreturn]] inline void throw_assertion_failed(const std::string& message) {
  VDIFRX_LOGE << " [assert] " << message << vdifrx::endl;
  VDIFRX_LOGD << " [assert] "
              << "stacktrace: " << '\n'
              << boost::stacktrace::stacktrace() << vdifrx::endl;
  throw vdif_error{errc::assertion_failed, message};
}

}  // namespace util
}  // namespace vdifrx

namespace boost {

inline void assertion_failed(char const* expr, char const* function,
                             char const* file, long line) {
  vdifrx::util::throw_assertion_failed(vdifrx::util::assertion_message(
      expr, nullptr, function, file, line));
}

inline void assertion_failed_msg(char const* expr, char const* msg,
                                 char const* function, char const* file,
                                 long line) {
  vdifrx::util::throw_assertion_failed(
      vdifrx::util::assertion_message(expr, msg, function, file, line));
}

}  // namespace boost

#endif  // __VDIFRX_UTIL_ASSERT__
