#pragma once

#include "ulidtool/core/uint128.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ulidtool::cli {

enum class Command {
  kGenerate,  // NOLINT(readability-identifier-naming)
  kInspect,   // NOLINT(readability-identifier-naming)
  kStep,      // NOLINT(readability-identifier-naming)
  kRange,     // NOLINT(readability-identifier-naming)
  kCheck,     // NOLINT(readability-identifier-naming)
};

// Which Generator member `generate` calls.
enum class StrategyChoice {
  kDefault,    // NOLINT(readability-identifier-naming)
  kRuntime,    // NOLINT(readability-identifier-naming)
  kLocal,      // NOLINT(readability-identifier-naming)
  kEnv,        // NOLINT(readability-identifier-naming)
  kThreadEnv,  // NOLINT(readability-identifier-naming)
  kShortEnv,   // NOLINT(readability-identifier-naming)
  kSlid,       // NOLINT(readability-identifier-naming)
};

// Identifier family that positional text is decoded as.
enum class IdFormat {
  kUlid,  // NOLINT(readability-identifier-naming)
  kSlid,  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::optional<Command> parse_command(std::string_view value);
[[nodiscard]] std::string_view to_string(Command command);

[[nodiscard]] std::optional<StrategyChoice> parse_strategy_choice(std::string_view value);
[[nodiscard]] std::string_view to_string(StrategyChoice strategy);

[[nodiscard]] std::optional<IdFormat> parse_id_format(std::string_view value);

// CliConfig holds all parsed flags of one ulidtool_cli invocation.
// Every field has an explicit default; optional fields mean "not configured".
struct CliConfig {
  Command command{Command::kGenerate};                    // NOLINT(readability-identifier-naming)
  StrategyChoice strategy{StrategyChoice::kDefault};      // NOLINT(readability-identifier-naming)
  IdFormat format{IdFormat::kUlid};                       // NOLINT(readability-identifier-naming)
  std::uint64_t count{1};                                 // NOLINT(readability-identifier-naming)
  core::Uint128 by{1u};                                   // NOLINT(readability-identifier-naming)
  bool reverse{false};                                    // NOLINT(readability-identifier-naming)
  bool system_checks{true};                               // NOLINT(readability-identifier-naming)
  std::optional<std::string> counter_file;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> counter_db;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> text;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;                        // NOLINT(readability-identifier-naming)
};

// parse_cli_config reads argv[1] as the subcommand and the rest as flags plus
// at most one positional identifier text. Parse problems land in errors.
[[nodiscard]] CliConfig parse_cli_config(int argc,
                                         const char* const argv[]);  // NOLINT(modernize-avoid-c-arrays)

// ULIDTOOL_SYSTEM_CHECKS: "0", "false", "off" or "no" disable startup checks.
// nullptr (unset) and any other value leave them enabled.
[[nodiscard]] bool system_checks_enabled(const char* env_value);

[[nodiscard]] std::string usage();

}  // namespace ulidtool::cli
