#pragma once

#include <expected>
#include <system_error>
#include <vector>

#include "core/merkle_tree.hpp"

namespace Forest::Core::MerkleTree {

// element[32] | depth u8 | elements[depth][32] | indices u64 LE | root[32]
constexpr size_t encoded_proof_size(size_t depth)
{
    return Crypto::HASH_SIZE + 1 + (depth * Crypto::HASH_SIZE) + 8 + Crypto::HASH_SIZE;
}

// Throws std::invalid_argument if the proof has more than 255 elements.
[[nodiscard]]
std::vector<Byte> encode_proof(const Proof& proof);

[[nodiscard]]
auto decode_proof(BytesSpan data) -> std::expected<Proof, std::error_code>;

} // namespace Forest::Core::MerkleTree
