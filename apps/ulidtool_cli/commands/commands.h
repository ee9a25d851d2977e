#pragma once

#include "ulidtool/core/clock.h"
#include "ulidtool/core/entropy.h"
#include "ulidtool/core/result.h"
#include "ulidtool/core/uint128.h"
#include "ulidtool/generator.h"

#include "config.h"
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

// Subcommand logic. Takes only library types and returns the JSON document
// the CLI prints, so each command is testable without a process boundary.
namespace ulidtool::cli {

using CommandResult = core::Result<nlohmann::json, core::DecodeError>;

// {"strategy": ..., "identifiers": [<identifier view>, ...]}
// Throws std::logic_error for StrategyChoice::kLocal on a generator without a counter store.
[[nodiscard]] nlohmann::json run_generate(Generator& generator, StrategyChoice strategy,
                                          std::uint64_t count);

// Identifier view of text plus the representation it was detected in.
[[nodiscard]] CommandResult run_inspect(std::string_view text, IdFormat format);

// {"from": <view>, "to": <view>, "steps": "<by>", "direction": "forward"|"backward"}
[[nodiscard]] CommandResult run_step(std::string_view text, IdFormat format, core::Uint128 by,
                                     bool reverse);

// {"direction": ..., "identifiers": [canonical, ...]}
[[nodiscard]] CommandResult run_range(std::string_view text, IdFormat format, std::uint64_t count,
                                      bool reverse);

[[nodiscard]] nlohmann::json run_check(core::ITimeSource& clock, core::IEntropySource& entropy);

}  // namespace ulidtool::cli
