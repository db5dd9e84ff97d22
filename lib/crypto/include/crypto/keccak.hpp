#pragma once

#include "crypto/common.hpp"

namespace Forest::Crypto {

// Original Keccak-256 (pad 0x01), as used by Ethereum. This is NOT FIPS-202
// SHA3-256, which pads with 0x06. OpenSSL 3.0 only ships the latter.
[[nodiscard]]
Hash keccak256(BytesSpan data);

} // namespace Forest::Crypto
