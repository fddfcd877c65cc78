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

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <thread>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/frame_stream.hpp"
#include "vdifrx/io/udp/vdif_receiver.hpp"
#include "vdifrx/memory/spsc_ring_buffer.hpp"
#include "vdifrx/program_options.hpp"

namespace vdifrx {
namespace main {

/**
 * @brief This program receives VDIF frames from UDP port, restores their order
 *        and writes them to a single file
 */
int vdifrx_receiver(int argc, char** argv) {
  vdifrx::changed_configs = vdifrx::program_options::parse_arguments(
      argc, argv, std::string(vdifrx::config.config_file_name));
  vdifrx::program_options::apply_changed_configs(vdifrx::changed_configs,
                                                 vdifrx::config);

  std::optional<std::ofstream> output_file;
  std::optional<vdifrx::io::frame_writer> frame_writer;
  if (!vdifrx::config.output_file_path.empty()) {
    output_file.emplace(vdifrx::config.output_file_path,
                        std::ios::binary | std::ios::trunc);
    if (!output_file->is_open()) [[unlikely]] {
      VDIFRX_LOGE << " [vdifrx_receiver] "
                  << "cannot open " << vdifrx::config.output_file_path
                  << vdifrx::endl;
      return EXIT_FAILURE;
    }
    frame_writer.emplace(output_file.value());
  }

  vdifrx::memory::spsc_ring_buffer<vdifrx::io::vdif_frame> ring_buffer{
      vdifrx::config.ring_buffer_capacity};
  vdifrx::io::udp::vdif_receiver<> receiver{
      vdifrx::io::udp::receiver_config::from(vdifrx::config), ring_buffer};
  receiver.start();

  const auto statistics_interval =
      std::chrono::milliseconds{vdifrx::config.statistics_interval};
  auto last_statistics_time = std::chrono::steady_clock::now();
  vdifrx::io::vdif_frame frame;
  size_t frame_count = 0;
  while (true) {
    if (vdifrx::termination_requested.load()) [[unlikely]] {
      receiver.stop();
    }
    const auto status =
        ring_buffer.blocking_pop(frame, std::chrono::milliseconds{100});
    if (status == vdifrx::memory::pop_status::closed) {
      break;
    }
    if (status == vdifrx::memory::pop_status::ok) {
      frame_count++;
      if (frame_writer.has_value()) {
        frame_writer->write_frame(frame);
      }
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - last_statistics_time >= statistics_interval) {
      receiver.log_statistics();
      last_statistics_time = now;
    }
  }
  if (frame_writer.has_value()) {
    frame_writer->flush();
  }
  VDIFRX_LOGI << " [vdifrx_receiver] "
              << "received " << frame_count << " frames" << vdifrx::endl;
  receiver.log_statistics();
  receiver.rethrow_if_failed();

  return EXIT_SUCCESS;
}

}  // namespace main
}  // namespace vdifrx

int main(int argc, char** argv) {
  return vdifrx::main::vdifrx_receiver(argc, argv);
}
