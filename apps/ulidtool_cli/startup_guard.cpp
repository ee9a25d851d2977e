#include "startup_guard.h"

namespace ulidtool::cli {

std::string validate_cli_config(const CliConfig& config) {
  if (!config.errors.empty()) {
    std::string message = "Error: " + config.errors.front();
    for (std::size_t i = 1; i < config.errors.size(); ++i) {
      message += "\nError: " + config.errors[i];
    }
    return message;
  }

  const std::string command(to_string(config.command));
  switch (config.command) {
    case Command::kInspect:
    case Command::kStep:
    case Command::kRange:
      if (!config.text.has_value()) {
        return "Error: " + command + " requires an identifier argument.\n"
               "       Usage: ulidtool_cli " + command + " <identifier> [options]";
      }
      break;
    case Command::kGenerate:
    case Command::kCheck:
      if (config.text.has_value()) {
        return "Error: " + command + " takes no identifier argument, got '" + *config.text + "'";
      }
      break;
  }

  const bool has_file = config.counter_file.has_value();
  const bool has_db = config.counter_db.has_value();
  if (config.strategy == StrategyChoice::kLocal) {
    if (!has_file && !has_db) {
      return "Error: --strategy local requires a persisted counter.\n"
             "       Pass --counter-file <path> or --counter-db <path>.";
    }
    if (has_file && has_db) {
      return "Error: --counter-file and --counter-db are mutually exclusive.";
    }
  } else if (has_file || has_db) {
    return "Error: --counter-file / --counter-db only apply to --strategy local.";
  }

  if (config.count == 0u) {
    return "Error: --count must be at least 1.";
  }

  return "";
}

}  // namespace ulidtool::cli
