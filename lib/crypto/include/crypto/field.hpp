#pragma once

#include "crypto/common.hpp"

namespace Forest::Crypto::Field {

// BN254 scalar field modulus (big-endian)
// 21888242871839275222246405745257275088548364400416034343698204186575808495617
constexpr Hash SNARK_SCALAR_FIELD = {
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29,
    0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x28, 0x33, 0xe8, 0x48, 0x79, 0xb9, 0x70, 0x91,
    0x43, 0xe1, 0xf5, 0x93, 0xf0, 0x00, 0x00, 0x01
};

// Interprets `value` as a big-endian integer and returns value mod SNARK_SCALAR_FIELD,
// left-padded to 32 bytes. Inputs wider than 32 bytes go through BIGNUM and
// throw std::runtime_error on OpenSSL failure.
[[nodiscard]]
Hash reduce(BytesSpan value);

// value < SNARK_SCALAR_FIELD
[[nodiscard]]
bool is_canonical(const Hash& value);

} // namespace Forest::Crypto::Field
