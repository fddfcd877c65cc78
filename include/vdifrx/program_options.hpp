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
#ifndef __VDIFRX_PROGRAM_OPTIONS__
#define __VDIFRX_PROGRAM_OPTIONS__

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include "vdifrx/config.hpp"
#include "vdifrx/log/log.hpp"

namespace vdifrx {
namespace program_options {

/**
 * @brief Read configs from command line & file.
 * @note sync configs & descriptions here and in vdifrx::configs
 * @return std::map<std::string, std::string> key-value pairs of changed options
 */
[[nodiscard]] inline auto parse_arguments(
    int argc, char** argv, const std::string& default_config_file_name)
    -> std::map<std::string, std::string> {
  // here values are stored in std::string to be evaluated later.
  boost::program_options::options_description general_option("General Options"),
      receiver_options("UDP Receiver Options"),
      reorder_options("Reorder Options"),
      file_io_options("File Input/Output Options"),
      simulator_options("Simulator Options"),
      cmd_only_options("Command Line Only Options"),
      cfg_file_options("Options available in config file"),
      all_option("Options");
  /* clang-format off */
    /*
      template:
      ("config_name", boost::program_options::value<std::string>(),
       "decsription")
    */
    cmd_only_options.add_options()
      ("help,h", "Show help message")
      ("config_file_name", boost::program_options::value<std::string>(),
       "Path to config file to be used to read other configs. ")
    ;
    general_option.add_options()
      ("log_level", boost::program_options::value<std::string>(),
       "Debug level for console log output, number or name. "
       "0: none, 1: error, 2: warning, 3: info, 4: debug")
      ("ring_buffer_capacity", boost::program_options::value<std::string>(),
       "Count of frames between UDP receiver and consumer, rounded up to power of 2. ")
      ("strict_version", boost::program_options::value<std::string>(),
       "if 1, frames with vdif_version other than 0 are malformed. ")
      ("statistics_interval", boost::program_options::value<std::string>(),
       "Interval of logging receiver statistics, in milliseconds. ")
    ;
    receiver_options.add_options()
      ("receiver_address", boost::program_options::value<std::string>(),
       "Address to receive VDIF UDP packets")
      ("receiver_port", boost::program_options::value<std::string>(),
       "Port to receive VDIF UDP packets")
      ("receiver_cpu_preferred", boost::program_options::value<std::string>(),
       "CPU core that UDP receiver should be bound to, -1 to disable. ")
      ("batch_size", boost::program_options::value<std::string>(),
       "Max count of datagrams received in one system call. ")
      ("receive_timeout", boost::program_options::value<std::string>(),
       "Timeout of one batched receive, in milliseconds. ")
      ("max_datagram_size", boost::program_options::value<std::string>(),
       "Size of buffer for one datagram, in bytes. ")
      ("transport_wrapper", boost::program_options::value<std::string>(),
       "if 1, each datagram starts with a transport header (VTP) "
       "carrying a little endian sequence number. ")
      ("transport_header_size", boost::program_options::value<std::string>(),
       "Length of transport header, in bytes. ")
    ;
    reorder_options.add_options()
      ("reorder_window_capacity", boost::program_options::value<std::string>(),
       "Max count of frames held for reordering, per thread. ")
      ("reorder_max_wait", boost::program_options::value<std::string>(),
       "Max time a frame may be held for reordering, in milliseconds. ")
      ("frames_per_second", boost::program_options::value<std::string>(),
       "Frames per second of each thread, 0 to learn from stream. ")
      ("drop_stale_frames", boost::program_options::value<std::string>(),
       "if 1, late or duplicated frames are dropped; "
       "if 0, they are passed through in arrival order. ")
    ;
    file_io_options.add_options()
      ("output_file_path", boost::program_options::value<std::string>(),
       "Path to write received frames. Empty to disable. ")
      ("input_file_path", boost::program_options::value<std::string>(),
       "Path to the VDIF file to be read. ")
      ("frame_size", boost::program_options::value<std::string>(),
       "Size of each frame in input file, in bytes. "
       "0 means read frame length from each header. ")
    ;
    simulator_options.add_options()
      ("sim_destination_address", boost::program_options::value<std::string>(),
       "Address to send simulated frames. ")
      ("sim_destination_port", boost::program_options::value<std::string>(),
       "Port to send simulated frames. ")
      ("sim_frame_size", boost::program_options::value<std::string>(),
       "Size of each simulated frame, in bytes, header included. ")
      ("sim_frame_count", boost::program_options::value<std::string>(),
       "Count of frames to send, 0 for unlimited. ")
      ("sim_frames_per_second", boost::program_options::value<std::string>(),
       "Frames per second of each simulated thread. ")
      ("sim_thread_count", boost::program_options::value<std::string>(),
       "Count of simulated threads, interleaved. ")
      ("sim_shuffle_distance", boost::program_options::value<std::string>(),
       "Frames are shuffled within blocks of this size before sending. ")
    ;
  /* clang-format on */
  cfg_file_options.add(general_option)
      .add(receiver_options)
      .add(reorder_options)
      .add(file_io_options)
      .add(simulator_options);
  all_option.add(cmd_only_options).add(cfg_file_options);

  // ref: https://www.boost.org/doc/libs/1_80_0/libs/program_options/example/multiple_sources.cpp
  // here: command line > config file > default config
  // the first read config is used, so read command line first
  boost::program_options::variables_map vm;
  boost::program_options::store(
      boost::program_options::command_line_parser(argc, argv)
          .options(all_option)
          .run(),
      vm);
  std::string config_file_name;
  if (vm.contains("config_file_name")) {
    config_file_name = vm["config_file_name"].as<std::string>();
  } else {
    config_file_name = default_config_file_name;
  }
  if (std::filesystem::exists(config_file_name)) {
    VDIFRX_LOGI << " [program_options] "
                << "using config file " << config_file_name
                << " (absolute path "
                << std::filesystem::absolute(config_file_name) << ")"
                << vdifrx::endl;
    boost::program_options::notify(vm);
    boost::program_options::store(
        boost::program_options::parse_config_file(config_file_name.c_str(),
                                                  cfg_file_options),
        vm);
    boost::program_options::notify(vm);
  } else {
    VDIFRX_LOGD << " [program_options] "
                << "config file " << config_file_name << " (absolute path "
                << std::filesystem::absolute(config_file_name)
                << ") not found." << vdifrx::endl;
  }

  if (vm.count("help")) {
    VDIFRX_LOGI << " [program_options] "
                << "Command line options:" << vdifrx::endl
                << all_option << vdifrx::endl;
    std::exit(0);
  }

  std::map<std::string, std::string> changed_configs;
  for (auto item : vm) {
    changed_configs[item.first] = item.second.as<std::string>();
  }
  return changed_configs;
}

/**
 * @brief parse a numeric or boolean option value
 * 
 * booleans accept 0 / 1 / true / false, other types use boost::lexical_cast
 * @throw boost::bad_lexical_cast if @c expression is not a valid @c T ,
 *        including negative values of unsigned @c T
 */
template <typename T>
inline auto parse(const std::string& expression) -> T {
  std::string trimmed = boost::algorithm::trim_copy(expression);
  if constexpr (std::is_same_v<T, bool>) {
    if (boost::algorithm::iequals(trimmed, "true")) {
      return true;
    }
    if (boost::algorithm::iequals(trimmed, "false")) {
      return false;
    }
  } else if constexpr (std::is_unsigned_v<T>) {
    // lexical_cast wraps "-1" around to max value
    if (boost::algorithm::starts_with(trimmed, "-")) {
      throw boost::bad_lexical_cast{typeid(std::string), typeid(T)};
    }
  }
  return boost::lexical_cast<T>(trimmed);
}

inline void evaluate_and_apply_changed_config(const std::string& name,
                                              const std::string& value,
                                              vdifrx::configs& config) {
#define VDIFRX_PARSE(target_name)                                        \
  if (name == #target_name) {                                            \
    using target_type = decltype(config.target_name);                    \
    const target_type parsed_value = parse<target_type>(value);          \
    VDIFRX_LOGI << " [program_options] " << #target_name << " = "        \
                << parsed_value << vdifrx::endl;                         \
    config.target_name = parsed_value;                                   \
  } else

#define VDIFRX_ASSIGN(target_name)                                         \
  if (name == #target_name) {                                              \
    VDIFRX_LOGI << " [program_options] " << #target_name << " = " << value \
                << vdifrx::endl;                                           \
    config.target_name = value;                                            \
  } else

  ;  // <- for clang-format
  VDIFRX_ASSIGN(receiver_address)
  VDIFRX_PARSE(receiver_port)
  VDIFRX_PARSE(receiver_cpu_preferred)
  VDIFRX_PARSE(batch_size)
  VDIFRX_PARSE(receive_timeout)
  VDIFRX_PARSE(max_datagram_size)
  VDIFRX_PARSE(transport_wrapper)
  VDIFRX_PARSE(transport_header_size)
  VDIFRX_PARSE(reorder_window_capacity)
  VDIFRX_PARSE(reorder_max_wait)
  VDIFRX_PARSE(frames_per_second)
  VDIFRX_PARSE(drop_stale_frames)
  VDIFRX_PARSE(ring_buffer_capacity)
  VDIFRX_PARSE(strict_version)
  VDIFRX_ASSIGN(output_file_path)
  VDIFRX_PARSE(statistics_interval)
  VDIFRX_ASSIGN(input_file_path)
  VDIFRX_PARSE(frame_size)
  VDIFRX_ASSIGN(sim_destination_address)
  VDIFRX_PARSE(sim_destination_port)
  VDIFRX_PARSE(sim_frame_size)
  VDIFRX_PARSE(sim_frame_count)
  VDIFRX_PARSE(sim_frames_per_second)
  VDIFRX_PARSE(sim_thread_count)
  VDIFRX_PARSE(sim_shuffle_distance)
  /* else */ if (name == "config_file_name") {
    // has been processed earlier
  } else if (name == "log_level") {
    const auto parsed_value =
        vdifrx::log::parse_level(boost::algorithm::trim_copy(value));
    if (!parsed_value) [[unlikely]] {
      throw boost::bad_lexical_cast{typeid(std::string),
                                    typeid(vdifrx::log::level)};
    }
    config.log_level = static_cast<int>(*parsed_value);
    vdifrx::log::current_level = *parsed_value;
    VDIFRX_LOGI << " [program_options] "
                << "log_level"
                << " = " << config.log_level << vdifrx::endl;
  } else {
    VDIFRX_LOGW << " [program_options] "
                << "Unrecognized config: name = " << '\"' << name << '\"'
                << ", "
                << "value = " << '\"' << value << '\"'
                << ", check option list at " __FILE__ ": " << __LINE__
                << vdifrx::endl;
  }

#undef VDIFRX_PARSE
#undef VDIFRX_ASSIGN
}

inline void apply_changed_configs(
    const std::map<std::string, std::string>& changed_configs,
    vdifrx::configs& config) {
  for (const auto& item : changed_configs) {
    evaluate_and_apply_changed_config(item.first, item.second, config);
  }
}

}  // namespace program_options
}  // namespace vdifrx

#endif  // __VDIFRX_PROGRAM_OPTIONS__
