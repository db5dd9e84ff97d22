#include "core/proof_codec.hpp"
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace Forest::Core::MerkleTree {
using Crypto::HASH_SIZE;

namespace {

    constexpr size_t INDICES_SIZE = 8;

    void write_u64_le(Byte* buf, uint64_t val)
    {
        for (size_t i = 0; i < INDICES_SIZE; ++i) {
            buf[i] = static_cast<Byte>(val >> (8 * i));
        }
    }

    uint64_t read_u64_le(const Byte* buf)
    {
        uint64_t val = 0;
        for (size_t i = 0; i < INDICES_SIZE; ++i) {
            val |= static_cast<uint64_t>(buf[i]) << (8 * i);
        }
        return val;
    }

    Byte* put_hash(Byte* out, const Hash& h)
    {
        std::memcpy(out, h.data(), HASH_SIZE);
        return out + HASH_SIZE;
    }

    const Byte* get_hash(const Byte* in, Hash& h)
    {
        std::memcpy(h.data(), in, HASH_SIZE);
        return in + HASH_SIZE;
    }

} // namespace

std::vector<Byte> encode_proof(const Proof& proof)
{
    if (proof.elements.size() > std::numeric_limits<uint8_t>::max()) {
        throw std::invalid_argument("Proof path too long to encode");
    }

    std::vector<Byte> out(encoded_proof_size(proof.elements.size()));
    Byte* p = put_hash(out.data(), proof.element);
    *p++ = static_cast<Byte>(proof.elements.size());
    for (const auto& sib : proof.elements) {
        p = put_hash(p, sib);
    }
    write_u64_le(p, proof.indices);
    p += INDICES_SIZE;
    put_hash(p, proof.root);

    return out;
}

auto decode_proof(BytesSpan data) -> std::expected<Proof, std::error_code>
{
    // 至少要能读到 depth 字节
    if (data.size() < HASH_SIZE + 1) {
        return std::unexpected(make_error_code(Error::MalformedProof));
    }
    size_t depth = data[HASH_SIZE];
    if (depth == 0 || data.size() != encoded_proof_size(depth)) {
        return std::unexpected(make_error_code(Error::MalformedProof));
    }

    Proof proof;
    const Byte* p = get_hash(data.data(), proof.element);
    ++p;
    proof.elements.resize(depth);
    for (auto& sib : proof.elements) {
        p = get_hash(p, sib);
    }
    proof.indices = read_u64_le(p);
    p += INDICES_SIZE;
    get_hash(p, proof.root);

    return proof;
}

} // namespace Forest::Core::MerkleTree
