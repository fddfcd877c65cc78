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
#ifndef __VDIFRX_LOG__
#define __VDIFRX_LOG__

#include <pthread.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <syncstream>

// usage: VDIFRX_LOGI << " [component] " << "message" << vdifrx::endl;
// one std::osyncstream per statement, so lines of receiver thread and
// consumer thread are not interleaved
#define VDIFRX_LOG(level)                 \
  if (vdifrx::log::is_enabled(level))     \
  std::osyncstream{std::cout} << vdifrx::log::line_prefix(level)

namespace vdifrx {

inline constexpr auto endl = '\n';

namespace log {

enum class level : int {
  NONE = 0,
  ERROR = 1,
  WARNING = 2,
  INFO = 3,
  DEBUG = 4
};

inline constexpr std::array<std::string_view, 5> level_names = {
    "none", "error", "warning", "info", "debug"};

/**
 * @brief parse log level, either a digit "0" ~ "4" or a name in
 *        @c level_names , case insensitive.
 */
inline auto parse_level(std::string_view text) -> std::optional<level> {
  if (text.size() == 1 && text[0] >= '0' && text[0] <= '4') {
    return static_cast<level>(text[0] - '0');
  }
  for (size_t i = 0; i < level_names.size(); i++) {
    const std::string_view name = level_names[i];
    if (std::equal(text.begin(), text.end(), name.begin(), name.end(),
                   [](char a, char b) {
                     return std::tolower(static_cast<unsigned char>(a)) == b;
                   })) {
      return static_cast<level>(i);
    }
  }
  return std::nullopt;
}

/** @brief level in env VDIFRX_LOG_LEVEL, if set and valid */
inline auto level_from_env_or(level default_level) -> level {
  const char* env = std::getenv("VDIFRX_LOG_LEVEL");
  if (env == nullptr) {
    return default_level;
  }
  return parse_level(env).value_or(default_level);
}

/**
  * @brief Log level for console output.
  * @see vdifrx::log::level
  */
inline level current_level = level_from_env_or(level::INFO);

inline auto is_enabled(level l) noexcept -> bool {
  return l != level::NONE &&
         static_cast<int>(l) <= static_cast<int>(current_level);
}

/** @brief colour only on terminals; receiver output is often redirected */
inline bool use_colour =
    (isatty(STDOUT_FILENO) == 1) && (std::getenv("NO_COLOR") == nullptr);

using clock_type = std::chrono::steady_clock;

/** @brief log time is relative to this */
inline const clock_type::time_point start_time = clock_type::now();

struct level_style {
  char tag;
  std::string_view colour;
};

constexpr auto style_of(level l) -> level_style {
  switch (l) {
    case level::ERROR:
      return {'E', "\033[1;31m"};
    case level::WARNING:
      return {'W', "\033[;35m"};
    case level::INFO:
      return {'I', "\033[;32m"};
    case level::DEBUG:
      return {'D', "\033[;36m"};
    case level::NONE:
    default:
      return {' ', ""};
  }
}

/**
 * @brief "[  elapsed ] T thread_name:", e.g. "[   1.234567] I vdif_receiver:"
 *        thread name is set by vdifrx::thread_affinity::set_thread_name
 */
inline auto line_prefix(level l) -> std::string {
  const level_style style = style_of(l);
  const double elapsed =
      std::chrono::duration<double>(clock_type::now() - start_time).count();

  // at most 16 bytes including '\0', see pthread_setname_np(3)
  char thread_name[16] = {};
  if (pthread_getname_np(pthread_self(), thread_name, sizeof(thread_name)) !=
      0) [[unlikely]] {
    thread_name[0] = '\0';
  }

  char text[48];
  std::snprintf(text, sizeof(text), "[%11.6f] %c %s:", elapsed, style.tag,
                thread_name);
  if (!use_colour) {
    return std::string{text};
  }
  return std::string{style.colour} + text + "\033[0m";
}

}  // namespace log
}  // namespace vdifrx

#define VDIFRX_LOGE VDIFRX_LOG(vdifrx::log::level::ERROR)
#define VDIFRX_LOGW VDIFRX_LOG(vdifrx::log::level::WARNING)
#define VDIFRX_LOGI VDIFRX_LOG(vdifrx::log::level::INFO)
#define VDIFRX_LOGD VDIFRX_LOG(vdifrx::log::level::DEBUG)

#endif  // __VDIFRX_LOG__
