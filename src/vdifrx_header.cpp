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

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/frame_stream.hpp"
#include "vdifrx/io/vdif_time.hpp"
#include "vdifrx/program_options.hpp"

namespace vdifrx {
namespace main {

/**
 * @brief This program prints header of every frame in a VDIF file
 */
int vdifrx_header(int argc, char** argv) {
  vdifrx::changed_configs = vdifrx::program_options::parse_arguments(
      argc, argv, std::string(vdifrx::config.config_file_name));
  vdifrx::program_options::apply_changed_configs(vdifrx::changed_configs,
                                                 vdifrx::config);

  if (vdifrx::config.input_file_path.empty()) {
    VDIFRX_LOGE << " [vdifrx_header] "
                << "input_file_path not set" << vdifrx::endl;
    return EXIT_FAILURE;
  }
  std::ifstream input_file{vdifrx::config.input_file_path, std::ios::binary};
  if (!input_file.is_open()) [[unlikely]] {
    VDIFRX_LOGE << " [vdifrx_header] "
                << "cannot open " << vdifrx::config.input_file_path
                << vdifrx::endl;
    return EXIT_FAILURE;
  }

  vdifrx::io::frame_reader reader{input_file, vdifrx::config.frame_size,
                                  vdifrx::config.strict_version};
  while (!vdifrx::termination_requested.load()) {
    const auto frame = reader.read_frame();
    if (!frame.has_value()) {
      break;
    }
    const auto& header = frame->header();
    std::cout << reader.frames_read() - 1 << ": " << header
              << ", mjd = " << vdifrx::io::header_mjd(header) << '\n';
  }
  VDIFRX_LOGI << " [vdifrx_header] "
              << reader.frames_read() << " frames read" << vdifrx::endl;

  return EXIT_SUCCESS;
}

}  // namespace main
}  // namespace vdifrx

int main(int argc, char** argv) {
  return vdifrx::main::vdifrx_header(argc, argv);
}
