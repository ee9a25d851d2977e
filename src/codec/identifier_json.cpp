#include "ulidtool/codec/identifier_json.h"

#include "ulidtool/codec/base32.h"
#include "ulidtool/codec/codec.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ulidtool::codec {

namespace {

template <typename Traits>
nlohmann::json describe(const BasicIdentifier<Traits>& id) {
  using json = nlohmann::json;
  const auto bytes = id.bytes();

  // nlohmann::json default object type is std::map, so keys sort alphabetically.
  json j;
  j["bin"] = to_bin(id);
  j["bytes"] = encode_hex(bytes);
  j["canonical"] = to_string(id);
  j["decimal"] = to_decimal(id);
  j["format"] = Traits::kName;
  j["hex"] = to_hex(id);
  j["oct"] = to_oct(id);
  j["randomness"] = core::to_string(id.randomness(), 10);
  j["repr"] = to_repr(id);
  j["timestamp_ms"] = id.timestamp();
  j["timestamp_utc"] = format_iso8601_ms(id.timestamp());
  return j;
}

}  // namespace

nlohmann::json identifier_to_json(const Ulid& id) {
  return describe(id);
}

nlohmann::json identifier_to_json(const Slid& id) {
  return describe(id);
}

nlohmann::json decode_error_to_json(const core::DecodeError& error) {
  nlohmann::json j;
  j["code"] = std::string(core::to_string(error.code));
  j["detail"] = error.detail;
  return j;
}

nlohmann::json integrity_report_to_json(const integrity::IntegrityReport& report) {
  nlohmann::json checks = nlohmann::json::array();
  for (const auto& check : report.checks) {
    nlohmann::json entry;
    entry["detail"] = check.detail;
    entry["name"] = check.name;
    entry["passed"] = check.passed;
    checks.push_back(std::move(entry));
  }

  nlohmann::json j;
  j["checks"] = std::move(checks);
  j["ok"] = report.ok();
  return j;
}

std::string format_iso8601_ms(const std::uint64_t timestamp_ms) {
  const auto seconds = static_cast<std::time_t>(timestamp_ms / 1000u);
  const auto millis = static_cast<unsigned>(timestamp_ms % 1000u);

  const std::tm* utc = std::gmtime(&seconds);
  if (utc == nullptr) {
    return std::to_string(timestamp_ms) + "ms";
  }
  std::ostringstream oss;
  oss << std::put_time(utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace ulidtool::codec
