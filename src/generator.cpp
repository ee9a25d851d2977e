#include "ulidtool/generator.h"

#include "ulidtool/core/errors.h"

#include <stdexcept>
#include <string>

namespace ulidtool {

namespace {

std::optional<integrity::IntegrityReport> startup_checks(const GeneratorOptions& options,
                                                         core::ITimeSource& clock,
                                                         core::IEntropySource& entropy) {
  if (!options.system_checks) {
    return std::nullopt;
  }
  auto report = integrity::run_system_checks(clock, entropy);
  integrity::enforce(report);
  return report;
}

}  // namespace

Generator::Generator(core::ITimeSource& clock, core::IEntropySource& entropy,
                     const GeneratorOptions options)
    : clock_(clock),
      integrity_report_(startup_checks(options, clock, entropy)),
      seeds_(entropy),
      runtime_counter_(UlidTraits::kRandomnessBits),
      env_counter_(strategy::EnvLexicalStrategy::kLayout.counter_bits),
      short_env_counter_(strategy::ShortEnvLexicalStrategy::kLayout.counter_bits),
      slid_counter_(strategy::SlidLexicalStrategy::kLayout.counter_bits),
      default_(entropy),
      runtime_(runtime_counter_),
      env_(seeds_, env_counter_),
      thread_env_(seeds_),
      short_env_(seeds_, short_env_counter_),
      slid_(seeds_, slid_counter_) {
  if (options.counter_store != nullptr) {
    local_counter_ = std::make_unique<counter::PersistedCounter>(*options.counter_store,
                                                                 UlidTraits::kRandomnessBits);
    local_ = std::make_unique<strategy::LocalLexicalStrategy>(*local_counter_);
  }
}

Ulid Generator::local_lexical() {
  if (!local_) {
    throw std::logic_error("local_lexical requires GeneratorOptions::counter_store");
  }
  return construct(*local_);
}

void Generator::flush() {
  if (local_counter_) {
    local_counter_->flush();
  }
}

std::uint64_t Generator::now() {
  const std::uint64_t ms = clock_.now_ms();
  if (ms > core::kMaxTimestampMs) {
    throw core::FatalInitializationError("clock reports " + std::to_string(ms) +
                                         " ms, beyond the 48-bit timestamp field");
  }
  return ms;
}

}  // namespace ulidtool
