#pragma once

#include "crypto/common.hpp"
#include <string_view>

namespace Forest::Crypto {

// Domain string for the empty-leaf value
constexpr std::string_view ZERO_VALUE_DOMAIN = "Railgun";

// Combine two tree nodes: SHA-256(0x01 || left || right) mod SNARK_SCALAR_FIELD.
[[nodiscard]]
Hash hash_left_right(const Hash& left, const Hash& right);

// keccak256("Railgun") mod SNARK_SCALAR_FIELD, computed once.
[[nodiscard]]
const Hash& zero_value();

namespace detail {
    // 域分离前缀，区分单输入哈希
    constexpr Byte NODE_PREFIX { 0x01 };
}

} // namespace Forest::Crypto
