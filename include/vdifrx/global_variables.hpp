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
#ifndef __VDIFRX_GLOBAL_VARIABLES__
#define __VDIFRX_GLOBAL_VARIABLES__

/*
 * This file contains global variables used by applications.
 * Library components take their settings explicitly, so that
 * more than one receiver may run in one process.
 */

#include <map>
#include <string>

#include "vdifrx/config.hpp"

namespace vdifrx {

// configs

inline vdifrx::configs config;

/** @brief names and expressions of changed items of @c vdifrx::config */
inline std::map<std::string, std::string> changed_configs;

// termination_requested in termination_handler.hpp because signal handler needs it.

}  // namespace vdifrx

#endif  // __VDIFRX_GLOBAL_VARIABLES__
