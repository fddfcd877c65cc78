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
#ifndef __VDIFRX_THREAD_AFFINITY__
#define __VDIFRX_THREAD_AFFINITY__

#include <hwloc.h>
#include <pthread.h>

#include <cstdlib>
#include <string>

#include "vdifrx/log/log.hpp"

namespace vdifrx {
namespace thread_affinity {

/**
 * @brief Set thread affinity of current thread to @c target_cpu
 * 
 * adapted from https://github.com/open-mpi/hwloc/blob/master/doc/examples/cpuset%2Bbitmap%2Bcpubind.c
 * ref: https://hwloc.readthedocs.io/en/v2.4/group__hwlocality__bitmap.html
 * @return EXIT_SUCCESS or EXIT_FAILURE, failure is logged but not fatal
 */
inline int set_thread_affinity(unsigned int target_cpu) {
  hwloc_topology_t topology = nullptr;
  hwloc_bitmap_t set = nullptr;
  hwloc_obj_t obj;
  int err = 0;

  do {
    err = hwloc_topology_init(&topology);
    if (err < 0) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "failed to initialize the topology" << vdifrx::endl;
      break;
    }
    err = hwloc_topology_load(topology);
    if (err < 0) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "failed to load the topology" << vdifrx::endl;
      break;
    }

    obj = hwloc_get_pu_obj_by_os_index(topology, target_cpu);
    if (obj == nullptr) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "no PU with OS index " << target_cpu << vdifrx::endl;
      err = -1;
      break;
    }

    set = hwloc_bitmap_alloc();
    if (!set) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "failed to allocate a bitmap" << vdifrx::endl;
      err = -1;
      break;
    }

    hwloc_bitmap_only(set, target_cpu);
    err = hwloc_set_cpubind(topology, set, HWLOC_CPUBIND_THREAD);
    if (err < 0) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "failed to set thread binding" << vdifrx::endl;
      break;
    }

    err = hwloc_get_last_cpu_location(topology, set, HWLOC_CPUBIND_THREAD);
    if (err < 0) {
      VDIFRX_LOGW << " [thread_affinity] "
                  << "failed to get last cpu location" << vdifrx::endl;
      break;
    }
    /* extract the PU OS index from the bitmap */
    unsigned int i = hwloc_bitmap_first(set);
    obj = hwloc_get_pu_obj_by_os_index(topology, i);
    VDIFRX_LOGI << " [thread_affinity] "
                << "thread is running on PU logical index "
                << obj->logical_index << " (OS/physical index " << i << ")"
                << vdifrx::endl;
  } while (0);

  if (set != nullptr) {
    hwloc_bitmap_free(set);
  }
  if (topology != nullptr) {
    hwloc_topology_destroy(topology);
  }

  if (err < 0) {
    return EXIT_FAILURE;
  } else {
    return EXIT_SUCCESS;
  }
}

/**
 * @brief set name of current thread, shown in top / gdb
 * @note linux limits name to 15 characters
 */
inline void set_thread_name(const std::string& name) {
  const std::string short_name = name.substr(0, 15);
  const int ret = pthread_setname_np(pthread_self(), short_name.c_str());
  if (ret != 0) [[unlikely]] {
    VDIFRX_LOGW << " [thread_affinity] "
                << "failed to set thread name to " << short_name
                << ", ret = " << ret << vdifrx::endl;
  }
}

}  // namespace thread_affinity
}  // namespace vdifrx

#endif  // __VDIFRX_THREAD_AFFINITY__
