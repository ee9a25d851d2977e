#pragma once

#include "config.h"
#include <string>

namespace ulidtool::cli {

// validate_cli_config checks the preconditions of one ulidtool_cli invocation.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no parse errors were collected
// - inspect, step and range have an identifier argument; generate and check have none
// - --strategy local has exactly one of --counter-file / --counter-db, and
//   neither flag is given with another strategy
// - --count is at least 1
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace ulidtool::cli
