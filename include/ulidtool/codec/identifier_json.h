#pragma once

#include "ulidtool/core/result.h"
#include "ulidtool/identifier.h"
#include "ulidtool/integrity/integrity.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ulidtool::codec {

// JSON views. Integers wider than 53 bits are emitted as decimal strings so
// that no JSON reader loses precision.

/// Every representation of a ULID: canonical, hex, oct, bin, repr, decimal,
/// bytes, plus the decoded timestamp (ms and ISO-8601) and randomness.
[[nodiscard]] nlohmann::json identifier_to_json(const Ulid& id);

/// Same view for a SLID.
[[nodiscard]] nlohmann::json identifier_to_json(const Slid& id);

[[nodiscard]] nlohmann::json decode_error_to_json(const core::DecodeError& error);

/// {"ok": bool, "checks": [{"name", "passed", "detail"}, ...]}
[[nodiscard]] nlohmann::json integrity_report_to_json(const integrity::IntegrityReport& report);

/// Milliseconds since the epoch as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string format_iso8601_ms(std::uint64_t timestamp_ms);

}  // namespace ulidtool::codec
