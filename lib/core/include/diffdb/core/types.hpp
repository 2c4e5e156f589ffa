#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

namespace diffdb {

// Virtual address inside one of the diffed binaries
using Address = std::uint64_t;

// Engine-assigned surrogate key (SQLite rowid)
using RowId = std::int64_t;

// Counter type for per-file statistics
using Count = std::int64_t;

// Invalid sentinels
inline constexpr Address INVALID_ADDRESS = std::numeric_limits<Address>::max();
inline constexpr RowId INVALID_ROW_ID = -1;

} // namespace diffdb
