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

#include <boost/lexical_cast.hpp>
// ---
#include <map>
#include <string>
#include <vector>

#include "vdifrx/commons.hpp"
// -- divide line for clang-format --
#include "test-common.hpp"
#include "vdifrx/io/udp/vdif_receiver.hpp"
#include "vdifrx/program_options.hpp"

#define VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(expr) \
  VDIFRX_CHECK_TEST("[test-program_options] ", expr)

void test_parse() {
  using vdifrx::program_options::parse;
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(parse<bool>("1"));
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(parse<bool>(" true "));
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(!parse<bool>("FALSE"));
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(!parse<bool>("0"));
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(parse<size_t>("8192") == 8192);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(parse<int>(" -1") == -1);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(parse<unsigned short>("12005") == 12005);

  bool thrown = false;
  try {
    (void)parse<size_t>("64k");
  } catch (const boost::bad_lexical_cast& e) {
    thrown = true;
  }
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(thrown);

  // negative values must not wrap around for unsigned options
  for (const std::string& value : {"-1", " -1", "-0"}) {
    thrown = false;
    try {
      (void)parse<size_t>(value);
    } catch (const boost::bad_lexical_cast& e) {
      thrown = true;
    }
    VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(thrown);
  }

  vdifrx::configs config;
  thrown = false;
  try {
    vdifrx::program_options::apply_changed_configs(
        {{"ring_buffer_capacity", "-1"}}, config);
  } catch (const boost::bad_lexical_cast& e) {
    thrown = true;
  }
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(thrown);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.ring_buffer_capacity == (size_t{1} << 14));

  // log level by name
  vdifrx::program_options::apply_changed_configs({{"log_level", " Warning"}}, config);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.log_level == 2);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(vdifrx::log::current_level == vdifrx::log::level::WARNING);
  thrown = false;
  try {
    vdifrx::program_options::apply_changed_configs({{"log_level", "verbose"}}, config);
  } catch (const boost::bad_lexical_cast& e) {
    thrown = true;
  }
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(thrown);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.log_level == 2);
  vdifrx::program_options::apply_changed_configs({{"log_level", "3"}}, config);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(vdifrx::log::current_level == vdifrx::log::level::INFO);
}

void test_apply_changed_configs() {
  vdifrx::configs config;
  const std::map<std::string, std::string> changed = {
      {"receiver_address", "127.0.0.1"},
      {"receiver_port", "23333"},
      {"batch_size", "32"},
      {"transport_wrapper", "true"},
      {"reorder_window_capacity", "16"},
      {"reorder_max_wait", "250"},
      {"frames_per_second", "25600"},
      {"drop_stale_frames", "1"},
      {"output_file_path", "/tmp/out.vdif"},
      {"no_such_option", "42"}};
  vdifrx::program_options::apply_changed_configs(changed, config);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.receiver_address == "127.0.0.1");
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.receiver_port == 23333);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.batch_size == 32);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.transport_wrapper);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.output_file_path == "/tmp/out.vdif");
  // untouched
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.ring_buffer_capacity == (size_t{1} << 14));
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(!config.strict_version);

  const auto receiver_config = vdifrx::io::udp::receiver_config::from(config);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.address == "127.0.0.1");
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.port == 23333);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.batch_size == 32);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.transport_wrapper);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.receive_timeout == std::chrono::milliseconds{1000});
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.reorder.window_capacity == 16);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.reorder.max_wait == std::chrono::milliseconds{250});
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.reorder.frames_per_second == 25600);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(receiver_config.reorder.drop_stale);
}

void test_parse_arguments() {
  std::vector<std::string> args = {"vdifrx_test", "--receiver_port", "12345",
                                   "--log_level=4", "--sim_thread_count", "3"};
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  const auto changed = vdifrx::program_options::parse_arguments(
      static_cast<int>(argv.size()), argv.data(),
      "/nonexistent/vdifrx_config.cfg");
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(changed.size() == 3);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(changed.at("receiver_port") == "12345");
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(changed.at("log_level") == "4");

  vdifrx::configs config;
  vdifrx::program_options::apply_changed_configs(changed, config);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.receiver_port == 12345);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.sim_thread_count == 3);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(config.log_level == 4);
  VDIFRX_CHECK_TEST_PROGRAM_OPTIONS(vdifrx::log::current_level == vdifrx::log::level::DEBUG);
}

int main() {
  test_parse();
  test_apply_changed_configs();
  test_parse_arguments();
  return 0;
}
