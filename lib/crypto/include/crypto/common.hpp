#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Forest::Crypto {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

// 固定宽度节点 (叶子 / 内部节点 / root)
constexpr size_t HASH_SIZE = 32;
using Hash = std::array<Byte, HASH_SIZE>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline const unsigned char* u8ptr(BytesSpan s)
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

namespace Utils {
    // lowercase, no 0x prefix
    std::string to_hex(BytesSpan data);

    // 左侧补零到 length 字节；超长时保留末尾 length 字节 (big-endian 低位)
    std::vector<Byte> to_byte_length(BytesSpan data, size_t length);

    // Shorthand for a 32-byte node built from a big-endian value.
    Hash to_hash(BytesSpan data);
} // namespace Utils

} // namespace Forest::Crypto
