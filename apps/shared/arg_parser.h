#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ulidtool::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. A failing
// handler is expected to say why via the error string it receives; the
// parser keeps going so that every problem is reported in one run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value, std::string& error)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Tokens that are not flags are collected as positionals
// in order. Unknown flags, missing values and handler failures are collected
// in errors rather than printed, leaving reporting to the caller.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, const char* const argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      std::string value;
      if (opt->requires_value) {
        if (i + 1 >= argc) {
          parsed.errors.push_back("Option " + arg + " requires a value");
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      std::string error;
      if (!opt->handler(parsed.config, value, error)) {
        parsed.errors.push_back(error.empty() ? "Invalid value for " + arg : error);
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      parsed.errors.push_back("Unknown option: " + arg);
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// format_options renders one line per option for usage text.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    oss << "  " << flag;
    if (flag.size() < 24) {
      oss << std::string(24 - flag.size(), ' ');
    } else {
      oss << "  ";
    }
    oss << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace ulidtool::apps
