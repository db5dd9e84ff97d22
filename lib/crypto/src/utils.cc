#include "crypto/common.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>

namespace Forest::Crypto::Utils {

namespace {

    constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

std::string to_hex(BytesSpan data)
{
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::vector<Byte> to_byte_length(BytesSpan data, size_t length)
{
    std::vector<Byte> out(length, Byte { 0 });
    if (data.size() >= length) {
        // 只保留低位 (末尾) 的 length 字节
        std::memcpy(out.data(), data.data() + (data.size() - length), length);
    } else {
        std::memcpy(out.data() + (length - data.size()), data.data(), data.size());
    }
    return out;
}

Hash to_hash(BytesSpan data)
{
    Hash h {};
    auto padded = to_byte_length(data, HASH_SIZE);
    std::copy(padded.begin(), padded.end(), h.begin());
    return h;
}

} // namespace Forest::Crypto::Utils
