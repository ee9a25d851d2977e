#include "commands.h"

#include "ulidtool/codec/codec.h"
#include "ulidtool/codec/identifier_json.h"
#include "ulidtool/codec/representation.h"
#include "ulidtool/integrity/integrity.h"
#include "ulidtool/progression/progression.h"

#include <string>

namespace ulidtool::cli {

namespace {

std::string_view direction_name(const bool reverse) {
  return reverse ? "backward" : "forward";
}

template <typename Id>
CommandResult inspect_as(const std::string_view text) {
  const auto decoded = codec::from_text<Id>(text);
  if (!decoded.has_value()) {
    return CommandResult::err(decoded.error());
  }
  nlohmann::json j = codec::identifier_to_json(decoded.value());
  j["input"] = std::string(text);
  j["representation"] = std::string(codec::to_string(codec::representation_of<Id>(text)));
  return CommandResult::ok(std::move(j));
}

template <typename Id>
CommandResult step_as(const std::string_view text, const core::Uint128 by, const bool reverse) {
  const auto decoded = codec::from_text<Id>(text);
  if (!decoded.has_value()) {
    return CommandResult::err(decoded.error());
  }
  const Id from = decoded.value();
  const Id to = reverse ? progression::backward(from, by) : progression::forward(from, by);

  nlohmann::json j;
  j["direction"] = std::string(direction_name(reverse));
  j["from"] = codec::identifier_to_json(from);
  j["steps"] = core::to_string(by, 10);
  j["to"] = codec::identifier_to_json(to);
  return CommandResult::ok(std::move(j));
}

template <typename Id>
CommandResult range_as(const std::string_view text, const std::uint64_t count, const bool reverse) {
  const auto decoded = codec::from_text<Id>(text);
  if (!decoded.has_value()) {
    return CommandResult::err(decoded.error());
  }
  auto sequence = progression::sequence(decoded.value(), count);
  if (reverse) {
    sequence = sequence.reversed();
  }

  nlohmann::json identifiers = nlohmann::json::array();
  for (const Id& id : sequence) {
    identifiers.push_back(codec::to_string(id));
  }

  nlohmann::json j;
  j["direction"] = std::string(direction_name(reverse));
  j["identifiers"] = std::move(identifiers);
  return CommandResult::ok(std::move(j));
}

}  // namespace

nlohmann::json run_generate(Generator& generator, const StrategyChoice strategy,
                            const std::uint64_t count) {
  nlohmann::json identifiers = nlohmann::json::array();
  for (std::uint64_t i = 0; i < count; ++i) {
    switch (strategy) {
      case StrategyChoice::kDefault:
        identifiers.push_back(codec::identifier_to_json(generator.ulid()));
        break;
      case StrategyChoice::kRuntime:
        identifiers.push_back(codec::identifier_to_json(generator.runtime_lexical()));
        break;
      case StrategyChoice::kLocal:
        identifiers.push_back(codec::identifier_to_json(generator.local_lexical()));
        break;
      case StrategyChoice::kEnv:
        identifiers.push_back(codec::identifier_to_json(generator.env_lexical()));
        break;
      case StrategyChoice::kThreadEnv:
        identifiers.push_back(codec::identifier_to_json(generator.thread_env_lexical()));
        break;
      case StrategyChoice::kShortEnv:
        identifiers.push_back(codec::identifier_to_json(generator.short_env_lexical()));
        break;
      case StrategyChoice::kSlid:
        identifiers.push_back(codec::identifier_to_json(generator.slid()));
        break;
    }
  }

  nlohmann::json j;
  j["identifiers"] = std::move(identifiers);
  j["strategy"] = std::string(to_string(strategy));
  return j;
}

CommandResult run_inspect(const std::string_view text, const IdFormat format) {
  return format == IdFormat::kSlid ? inspect_as<Slid>(text) : inspect_as<Ulid>(text);
}

CommandResult run_step(const std::string_view text, const IdFormat format, const core::Uint128 by,
                       const bool reverse) {
  return format == IdFormat::kSlid ? step_as<Slid>(text, by, reverse)
                                   : step_as<Ulid>(text, by, reverse);
}

CommandResult run_range(const std::string_view text, const IdFormat format,
                        const std::uint64_t count, const bool reverse) {
  return format == IdFormat::kSlid ? range_as<Slid>(text, count, reverse)
                                   : range_as<Ulid>(text, count, reverse);
}

nlohmann::json run_check(core::ITimeSource& clock, core::IEntropySource& entropy) {
  return codec::integrity_report_to_json(integrity::run_system_checks(clock, entropy));
}

}  // namespace ulidtool::cli
