#pragma once

#include "diffdb/core/types.hpp"
#include <bit>
#include <cstdint>

namespace diffdb {

// SQLite only has signed 64-bit integer columns. Addresses are stored with
// their bit pattern unchanged, so anything >= 0x8000000000000000 comes back
// negative and has to be reinterpreted on read.

[[nodiscard]] constexpr std::int64_t encode_address(Address address) noexcept {
    return std::bit_cast<std::int64_t>(address);
}

[[nodiscard]] constexpr Address decode_address(std::int64_t stored) noexcept {
    return std::bit_cast<Address>(stored);
}

static_assert(decode_address(-1) == 0xFFFFFFFFFFFFFFFFull);
static_assert(encode_address(0x8000000000000000ull) < 0);

} // namespace diffdb
