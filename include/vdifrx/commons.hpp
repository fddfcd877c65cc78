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
#ifndef __VDIFRX_COMMONS__
#define __VDIFRX_COMMONS__

/**
 * This file should contain commonly included headers, and forward
 * declaration if needed.
 */

#include "vdifrx/config.hpp"
#include "vdifrx/error.hpp"

#define VDIFRX_CHECK(expr, expected, handle) \
  {                                          \
    auto ret = expr;                         \
    if (ret != expected) [[unlikely]] {      \
      handle;                                \
    }                                        \
  }

// ------ dividing line for clang-format ------

#include "vdifrx/global_variables.hpp"
#include "vdifrx/log/log.hpp"
#include "vdifrx/util/assert.hpp"
#include "vdifrx/util/termination_handler.hpp"

#endif  // __VDIFRX_COMMONS__
