#include "ulidtool/core/clock.h"
#include "ulidtool/core/entropy.h"
#include "ulidtool/core/errors.h"
#include "ulidtool/core/version.h"
#include "ulidtool/generator.h"
#include "ulidtool/storage/counter_store.h"
#include "ulidtool/storage/sqlite/sqlite_counter_store.h"
#include "ulidtool/storage/sqlite/sqlite_db.h"

#include "commands/commands.h"
#include "config.h"
#include "startup_guard.h"
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

// Counter row name used for --counter-db.
constexpr const char* kLocalCounterName = "local_lexical";

void print_json(const nlohmann::json& j) {
  std::cout << j.dump(2) << "\n";
}

int print_decode_error(const ulidtool::core::DecodeError& error) {
  std::cerr << "Error: cannot decode identifier (" << ulidtool::core::to_string(error.code)
            << "): " << error.detail << "\n";
  return kExitUsage;
}

// open_counter_store builds the store selected by --counter-file / --counter-db.
// Returns nullptr when neither is configured.
std::unique_ptr<ulidtool::storage::ICounterStore> open_counter_store(
    const ulidtool::cli::CliConfig& config) {
  if (config.counter_file.has_value()) {
    return std::make_unique<ulidtool::storage::FileCounterStore>(config.counter_file.value());
  }
  if (!config.counter_db.has_value()) {
    return nullptr;
  }

  auto db_result = ulidtool::storage::sqlite::SqliteDb::open_migrated(config.counter_db.value());
  if (!db_result.has_value()) {
    throw std::runtime_error(db_result.error());
  }
  return std::make_unique<ulidtool::storage::sqlite::SqliteCounterStore>(db_result.value(),
                                                                         kLocalCounterName);
}

int run_generate(const ulidtool::cli::CliConfig& config) {
  ulidtool::core::SystemClock clock;
  ulidtool::core::SystemEntropySource entropy;

  std::unique_ptr<ulidtool::storage::ICounterStore> store;
  try {
    store = open_counter_store(config);
  } catch (const std::exception& e) {
    std::cerr << "Failed to open counter store: " << e.what() << "\n";
    return kExitUsage;
  }

  ulidtool::GeneratorOptions options;
  options.system_checks = config.system_checks;
  options.counter_store = store.get();

  ulidtool::Generator generator(clock, entropy, options);
  const auto result = ulidtool::cli::run_generate(generator, config.strategy, config.count);
  generator.flush();
  print_json(result);
  return kExitOk;
}

int dispatch(const ulidtool::cli::CliConfig& config) {
  using ulidtool::cli::Command;

  switch (config.command) {
    case Command::kGenerate:
      return run_generate(config);
    case Command::kInspect: {
      const auto result = ulidtool::cli::run_inspect(config.text.value(), config.format);
      if (!result.has_value()) {
        return print_decode_error(result.error());
      }
      print_json(result.value());
      return kExitOk;
    }
    case Command::kStep: {
      const auto result =
          ulidtool::cli::run_step(config.text.value(), config.format, config.by, config.reverse);
      if (!result.has_value()) {
        return print_decode_error(result.error());
      }
      print_json(result.value());
      return kExitOk;
    }
    case Command::kRange: {
      const auto result =
          ulidtool::cli::run_range(config.text.value(), config.format, config.count, config.reverse);
      if (!result.has_value()) {
        return print_decode_error(result.error());
      }
      print_json(result.value());
      return kExitOk;
    }
    case Command::kCheck: {
      ulidtool::core::SystemClock clock;
      ulidtool::core::SystemEntropySource entropy;
      const auto report = ulidtool::cli::run_check(clock, entropy);
      print_json(report);
      return report.value("ok", false) ? kExitOk : kExitFatal;
    }
  }
  return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc > 1) {
    const std::string first = argv[1];
    if (first == "--help" || first == "-h") {
      std::cout << ulidtool::cli::usage();
      return kExitOk;
    }
    if (first == "--version") {
      std::cout << "ulidtool " << ulidtool::core::kBuildVersion << "\n";
      return kExitOk;
    }
  }

  auto config = ulidtool::cli::parse_cli_config(argc, argv);
  if (!ulidtool::cli::system_checks_enabled(std::getenv("ULIDTOOL_SYSTEM_CHECKS"))) {
    config.system_checks = false;
  }

  const std::string guard_error = ulidtool::cli::validate_cli_config(config);
  if (!guard_error.empty()) {
    std::cerr << guard_error << "\n\n" << ulidtool::cli::usage();
    return kExitUsage;
  }

  try {
    return dispatch(config);
  } catch (const ulidtool::core::FatalInitializationError& e) {
    std::cerr << "FATAL: " << e.what() << "\n";
    return kExitFatal;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }
}
