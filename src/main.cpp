#include <iostream>
#include <string>
#include <unordered_map>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "engine/recovery_orchestrator.hpp"
#include "logger/logger.hpp"
#include "store/path_utils.hpp"
#include "store/record_store.hpp"

struct ProgramOptions {
  std::string owner;
  std::string config_path;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -u <owner> [-c <config.yaml>]\n"
        << "Required arguments:\n"
        << "  -u, --user    Owner whose namespace the shell operates on\n"
        << "Optional arguments:\n"
        << "  -c, --config  YAML configuration file\n"
        << "Example: " << program_name << " -u alice -c chunkvault.yaml\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-u", &ProgramOptions::owner},
    {"--user", &ProgramOptions::owner},
    {"-c", &ProgramOptions::config_path},
    {"--config", &ProgramOptions::config_path}
  };

  ProgramOptions options;
  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.*(it->second) = argv[i + 1];
  }

  if (!chunkvault::store::is_safe_component(options.owner)) {
    std::cerr << "Error: Owner must be a non-empty name made of letters, digits, '_', '.' or '-'\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

chunkvault::config::EngineConfig load_engine_config(const std::string& config_path) {
  chunkvault::config::EngineConfig config;
  if (!config_path.empty()) {
    config = chunkvault::config::load_config(config_path);
  }
  chunkvault::config::apply_env_overrides(config);
  chunkvault::config::validate(config);
  return config;
}

bool run_shell(const ProgramOptions& options) {
  try {
    const auto config = load_engine_config(options.config_path);
    chunkvault::logging::init_logging(config.log_file, chunkvault::logging::parse_severity(config.log_level), true);

    chunkvault::store::YamlRecordStore records(config.records_root);
    chunkvault::engine::RecoveryOrchestrator orchestrator(config, records);
    orchestrator.initialize();

    chunkvault::cli::CLI cli(orchestrator, options.owner);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start chunkvault: " << e.what() << '\n';
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
