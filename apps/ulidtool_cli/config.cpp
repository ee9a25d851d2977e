#include "config.h"

#include "shared/arg_parser.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace ulidtool::cli {

namespace {

using CliOption = apps::Option<CliConfig>;

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_strategy(CliConfig& config, const std::string& value, std::string& error) {
  const auto strategy = parse_strategy_choice(value);
  if (!strategy.has_value()) {
    error = "Invalid --strategy: " + value +
            " (valid: default, runtime, local, env, thread-env, short-env, slid)";
    return false;
  }
  config.strategy = strategy.value();
  return true;
}

bool handle_count(CliConfig& config, const std::string& value, std::string& error) {
  const auto parsed = core::parse_uint128(value, 10);
  if (!parsed.has_value() || !parsed->fits_in(64)) {
    error = "Invalid --count: " + value + " (expected a non-negative integer)";
    return false;
  }
  config.count = parsed->lo;
  return true;
}

bool handle_by(CliConfig& config, const std::string& value, std::string& error) {
  const auto parsed = core::parse_uint128(value, 10);
  if (!parsed.has_value()) {
    error = "Invalid --by: " + value +
            " (expected a non-negative integer; use --reverse to step back)";
    return false;
  }
  config.by = parsed.value();
  return true;
}

bool handle_format(CliConfig& config, const std::string& value, std::string& error) {
  const auto format = parse_id_format(value);
  if (!format.has_value()) {
    error = "Invalid --format: " + value + " (valid: ulid, slid)";
    return false;
  }
  config.format = format.value();
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<CliOption> build_option_registry() {
  return {
      {"--strategy", true,
       "Randomness strategy (default|runtime|local|env|thread-env|short-env|slid)",
       handle_strategy},
      {"--count", true, "Number of identifiers to generate or list", handle_count},
      {"--counter-file", true, "Text file persisting the local strategy counter",
       [](CliConfig& c, const std::string& v, std::string&) {
         c.counter_file = v;
         return true;
       }},
      {"--counter-db", true, "SQLite database persisting the local strategy counter",
       [](CliConfig& c, const std::string& v, std::string&) {
         c.counter_db = v;
         return true;
       }},
      {"--no-system-checks", false, "Skip startup integrity checks",
       [](CliConfig& c, const std::string&, std::string&) {
         c.system_checks = false;
         return true;
       }},
      {"--by", true, "Step size for step", handle_by},
      {"--reverse", false, "Step or list backwards",
       [](CliConfig& c, const std::string&, std::string&) {
         c.reverse = true;
         return true;
       }},
      {"--format", true, "Identifier family of the input text (ulid|slid)", handle_format},
  };
}

}  // namespace

std::optional<Command> parse_command(const std::string_view value) {
  if (value == "generate") {
    return Command::kGenerate;
  }
  if (value == "inspect") {
    return Command::kInspect;
  }
  if (value == "step") {
    return Command::kStep;
  }
  if (value == "range") {
    return Command::kRange;
  }
  if (value == "check") {
    return Command::kCheck;
  }
  return std::nullopt;
}

std::string_view to_string(const Command command) {
  switch (command) {
    case Command::kGenerate:
      return "generate";
    case Command::kInspect:
      return "inspect";
    case Command::kStep:
      return "step";
    case Command::kRange:
      return "range";
    case Command::kCheck:
      return "check";
  }
  return "unknown";
}

std::optional<StrategyChoice> parse_strategy_choice(const std::string_view value) {
  if (value == "default") {
    return StrategyChoice::kDefault;
  }
  if (value == "runtime") {
    return StrategyChoice::kRuntime;
  }
  if (value == "local") {
    return StrategyChoice::kLocal;
  }
  if (value == "env") {
    return StrategyChoice::kEnv;
  }
  if (value == "thread-env") {
    return StrategyChoice::kThreadEnv;
  }
  if (value == "short-env") {
    return StrategyChoice::kShortEnv;
  }
  if (value == "slid") {
    return StrategyChoice::kSlid;
  }
  return std::nullopt;
}

std::string_view to_string(const StrategyChoice strategy) {
  switch (strategy) {
    case StrategyChoice::kDefault:
      return "default";
    case StrategyChoice::kRuntime:
      return "runtime";
    case StrategyChoice::kLocal:
      return "local";
    case StrategyChoice::kEnv:
      return "env";
    case StrategyChoice::kThreadEnv:
      return "thread-env";
    case StrategyChoice::kShortEnv:
      return "short-env";
    case StrategyChoice::kSlid:
      return "slid";
  }
  return "unknown";
}

std::optional<IdFormat> parse_id_format(const std::string_view value) {
  if (value == "ulid") {
    return IdFormat::kUlid;
  }
  if (value == "slid") {
    return IdFormat::kSlid;
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

CliConfig parse_cli_config(int argc, const char* const argv[]) {
  CliConfig defaults;
  if (argc < 2) {
    defaults.errors.emplace_back("Missing subcommand");
    return defaults;
  }

  const std::string subcommand = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto command = parse_command(subcommand);
  if (!command.has_value()) {
    defaults.errors.push_back("Unknown subcommand: " + subcommand);
    return defaults;
  }
  defaults.command = command.value();

  auto parsed = apps::parse_options(argc, argv, build_option_registry(), 2, std::move(defaults));
  CliConfig config = std::move(parsed.config);
  config.errors.insert(config.errors.end(), parsed.errors.begin(), parsed.errors.end());

  if (parsed.positionals.size() > 1) {
    config.errors.push_back("Expected at most one identifier, got " +
                            std::to_string(parsed.positionals.size()));
  } else if (!parsed.positionals.empty()) {
    config.text = parsed.positionals.front();
  }
  return config;
}

bool system_checks_enabled(const char* env_value) {
  if (env_value == nullptr) {
    return true;
  }
  std::string value = env_value;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return !(value == "0" || value == "false" || value == "off" || value == "no");
}

std::string usage() {
  return "Usage: ulidtool_cli <generate|inspect|step|range|check> [<identifier>] [options]\n"
         "\n"
         "  generate              Construct --count identifiers with --strategy\n"
         "  inspect <id>          Decode any representation and print every view\n"
         "  step <id>             Move --by N forward (or back with --reverse)\n"
         "  range <id>            List --count identifiers starting at <id>\n"
         "  check                 Run the system integrity checks\n"
         "\n"
         "Options:\n" +
         apps::format_options(build_option_registry()) +
         "\n"
         "Environment:\n"
         "  ULIDTOOL_SYSTEM_CHECKS=0  Skip startup integrity checks\n";
}

}  // namespace ulidtool::cli
