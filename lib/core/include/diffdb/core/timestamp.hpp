#pragma once

#include "diffdb/core/result.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace diffdb {

using Timestamp = std::chrono::sys_seconds;

// Textual form stored in the metadata table: "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] std::string format_timestamp(Timestamp ts);

// Inverse of format_timestamp; rejects anything that is not exactly that shape
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view text);

// Current UTC time. The metadata created/modified columns are written in UTC,
// not local time, so readers must not apply a timezone offset.
[[nodiscard]] Timestamp now_timestamp();

} // namespace diffdb
