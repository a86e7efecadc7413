#include "cli/options.hpp"
#include <stdexcept>
#include <unordered_map>

namespace gntp {
namespace cli {

namespace {

enum class Flag {
  HOST,
  PORT,
  PASSWORD,
  STORE,
  DISCARD_RESOURCES,
  MEMORY_LIMIT,
  LOG_FILE,
  VERBOSE,
  READ_TIMEOUT,
  IGNORE_UNAUTHORIZED_NOTIFY,
  HELP
};

const std::unordered_map<std::string, Flag> flag_map = {
  {"-h", Flag::HOST},
  {"--host", Flag::HOST},
  {"-p", Flag::PORT},
  {"--port", Flag::PORT},
  {"-k", Flag::PASSWORD},
  {"--password", Flag::PASSWORD},
  {"-s", Flag::STORE},
  {"--store", Flag::STORE},
  {"--discard-resources", Flag::DISCARD_RESOURCES},
  {"--memory-limit", Flag::MEMORY_LIMIT},
  {"-l", Flag::LOG_FILE},
  {"--log-file", Flag::LOG_FILE},
  {"-v", Flag::VERBOSE},
  {"--verbose", Flag::VERBOSE},
  {"--read-timeout", Flag::READ_TIMEOUT},
  {"--ignore-unauthorized-notify", Flag::IGNORE_UNAUTHORIZED_NOTIFY},
  {"--help", Flag::HELP}
};

bool takes_value(Flag flag) {
  switch (flag) {
    case Flag::HOST:
    case Flag::PORT:
    case Flag::PASSWORD:
    case Flag::STORE:
    case Flag::MEMORY_LIMIT:
    case Flag::LOG_FILE:
    case Flag::READ_TIMEOUT:
      return true;
    default:
      return false;
  }
}

// Parses a decimal integer in [min, max]; throws std::invalid_argument or std::out_of_range
long parse_number(const std::string& value, long min, long max) {
  std::size_t consumed = 0;
  const long number = std::stol(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("trailing characters");
  }
  if (number < min || number > max) {
    throw std::out_of_range("out of range");
  }
  return number;
}

} // namespace

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -h, --host <address>          Listen address (default 0.0.0.0)\n"
      << "  -p, --port <port>             Listen port (default " << DEFAULT_PORT << ")\n"
      << "  -k, --password <password>     Accepted password, may be repeated\n"
      << "  -s, --store <directory>       Keep resources on disk under directory\n"
      << "      --discard-resources       Read resources but keep nothing\n"
      << "      --memory-limit <MiB>      Memory held by in-memory resources (default 64)\n"
      << "  -l, --log-file <file>         Also log to file\n"
      << "  -v, --verbose                 Log debug messages\n"
      << "      --read-timeout <seconds>  Close connections idle this long (0 = never)\n"
      << "      --ignore-unauthorized-notify\n"
      << "                                Accept but drop NOTIFY requests with a wrong password\n"
      << "      --help                    Show this message\n"
      << "Example: " << program_name << " -p " << DEFAULT_PORT << " -k secret\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "gntpd";

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    auto it = flag_map.find(arg);
    if (it == flag_map.end()) {
      err << "Error: Unknown argument: " << arg << '\n';
      print_usage(program_name, err);
      return options;
    }

    const Flag flag = it->second;
    std::string value;
    if (takes_value(flag)) {
      if (i + 1 >= argc) {
        err << "Error: Missing value for " << arg << '\n';
        print_usage(program_name, err);
        return options;
      }
      value = argv[++i];
    }

    try {
      switch (flag) {
        case Flag::HOST:                       options.host = value; break;
        case Flag::PORT:                       options.port = static_cast<uint16_t>(parse_number(value, 1, 65535)); break;
        case Flag::PASSWORD:                   options.passwords.push_back(value); break;
        case Flag::STORE:                      options.store_path = value; break;
        case Flag::DISCARD_RESOURCES:          options.discard_resources = true; break;
        case Flag::MEMORY_LIMIT:               options.memory_limit_mb = static_cast<std::size_t>(parse_number(value, 1, 65536)); break;
        case Flag::LOG_FILE:                   options.log_file = value; break;
        case Flag::VERBOSE:                    options.verbose = true; break;
        case Flag::READ_TIMEOUT:               options.read_timeout = std::chrono::seconds(parse_number(value, 0, 86400)); break;
        case Flag::IGNORE_UNAUTHORIZED_NOTIFY: options.ignore_unauthorized_notify = true; break;
        case Flag::HELP:                       options.show_help = true; break;
      }
    } catch (const std::logic_error&) {
      err << "Error: Invalid value for " << arg << ": " << value << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (options.host.empty()) {
    err << "Error: Host must not be empty\n";
    print_usage(program_name, err);
    return options;
  }
  if (!options.store_path.empty() && options.discard_resources) {
    err << "Error: --store and --discard-resources are mutually exclusive\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace gntp
