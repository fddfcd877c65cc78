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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <random>
#include <thread>
#include <vector>

#include "vdifrx/commons.hpp"
#include "vdifrx/io/udp/frame_sender.hpp"
#include "vdifrx/io/vdif_sim.hpp"
#include "vdifrx/program_options.hpp"

namespace vdifrx {
namespace main {

/**
 * @brief This program sends simulated VDIF frames to a UDP port,
 *        optionally shuffled to test reordering of receiver
 */
int vdifrx_sim(int argc, char** argv) {
  vdifrx::changed_configs = vdifrx::program_options::parse_arguments(
      argc, argv, std::string(vdifrx::config.config_file_name));
  vdifrx::program_options::apply_changed_configs(vdifrx::changed_configs,
                                                 vdifrx::config);

  vdifrx::io::frame_simulator simulator{vdifrx::config.sim_frame_size,
                                        vdifrx::config.sim_frames_per_second,
                                        vdifrx::config.sim_thread_count};
  vdifrx::io::udp::frame_sender sender{
      vdifrx::config.sim_destination_address,
      vdifrx::config.sim_destination_port, vdifrx::config.transport_wrapper,
      vdifrx::config.transport_header_size};

  // pace sending to frames_per_second of all threads
  const auto frame_interval = std::chrono::duration<double>{
      1.0 / (static_cast<double>(vdifrx::config.sim_frames_per_second) *
             vdifrx::config.sim_thread_count)};
  const size_t block_size = std::max(vdifrx::config.sim_shuffle_distance, size_t{1});
  const size_t frame_count = vdifrx::config.sim_frame_count;
  std::mt19937_64 rng{std::random_device{}()};
  std::vector<vdifrx::io::vdif_frame> block;
  block.reserve(block_size);

  VDIFRX_LOGI << " [vdifrx_sim] "
              << "sending to " << vdifrx::config.sim_destination_address << ":"
              << vdifrx::config.sim_destination_port << vdifrx::endl;
  const auto start_time = std::chrono::steady_clock::now();
  size_t sent = 0;
  while ((frame_count == 0 || sent < frame_count) &&
         !vdifrx::termination_requested.load()) {
    block.clear();
    while (block.size() < block_size &&
           (frame_count == 0 || sent + block.size() < frame_count)) {
      block.push_back(simulator.generate_frame());
    }
    std::shuffle(block.begin(), block.end(), rng);
    for (const auto& frame : block) {
      sender.send_frame(frame);
      sent++;
    }
    std::this_thread::sleep_until(
        start_time + std::chrono::duration_cast<std::chrono::nanoseconds>(
                         frame_interval * sent));
  }
  VDIFRX_LOGI << " [vdifrx_sim] "
              << "sent " << sent << " frames" << vdifrx::endl;

  return EXIT_SUCCESS;
}

}  // namespace main
}  // namespace vdifrx

int main(int argc, char** argv) {
  return vdifrx::main::vdifrx_sim(argc, argv);
}
