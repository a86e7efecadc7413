#ifndef GNTP_CLI_OPTIONS_HPP
#define GNTP_CLI_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace gntp {
namespace cli {

constexpr uint16_t DEFAULT_PORT = 23053;

struct ProgramOptions {
  std::string host{"0.0.0.0"};
  uint16_t port{DEFAULT_PORT};
  std::vector<std::string> passwords;
  // Resource directory; empty keeps resources in memory
  std::string store_path;
  bool discard_resources{false};
  // Cap on resources held in memory when no store directory is given
  std::size_t memory_limit_mb{64};
  std::string log_file;
  bool verbose{false};
  std::chrono::seconds read_timeout{0};
  bool ignore_unauthorized_notify{false};

  bool show_help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out = std::cerr);

// Parses argv; on error prints the reason and usage to err and returns
// options with valid == false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err = std::cerr);

} // namespace cli
} // namespace gntp

#endif // GNTP_CLI_OPTIONS_HPP
