#include <iostream>
#include <string>
#include <unordered_map>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/storage.hpp"

struct ProgramOptions {
  std::string config_path;
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <config.json> [-v]\n"
        << "Required arguments:\n"
        << "  -c, --config   Backend configuration (JSON)\n"
        << "Optional arguments:\n"
        << "  -v, --verbose  Log chunk boundaries to the console\n"
        << "Example: " << program_name << " -c mailchunk.json\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, bool> flag_takes_value = {
    {"-c", true},
    {"--config", true},
    {"-v", false},
    {"--verbose", false}
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    auto it = flag_takes_value.find(flag);
    if (it == flag_takes_value.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (!it->second) {
      options.verbose = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.config_path = argv[++i];
  }

  if (options.config_path.empty()) {
    std::cerr << "Error: A configuration file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  namespace config = mailchunk::config;
  namespace logging = mailchunk::logging;

  try {
    config::BackendConfig backend_config = config::load_backend_config(options.config_path);

    logging::severity_level level = options.verbose
        ? boost::log::trivial::trace
        : logging::parse_severity(backend_config.get<std::string>(config::LOG_LEVEL_KEY, "warning"));
    if (auto log_file = backend_config.get_optional<std::string>(config::LOG_FILE_KEY)) {
      logging::init_logging(*log_file, level);
    } else {
      logging::init_console_logging(level);
    }

    auto storage = mailchunk::store::make_storage(config::ChunkSaverConfig::extract(backend_config));
    storage->initialize(backend_config);

    mailchunk::cli::CLI cli(storage);
    cli.run();

    storage->shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
