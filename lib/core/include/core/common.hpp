#pragma once

#include "core/error.hpp"
#include "crypto/common.hpp"
#include <cstddef>
#include <expected>
#include <system_error>

namespace Forest::Core {

using Crypto::Byte;
using Crypto::BytesSpan;
using Crypto::Hash;

/// Default tree depth (capacity 65536 leaves per tree)
constexpr int kDefaultDepth = 16;
/// Deepest supported tree; positions and proof indices stay within 64 bits
constexpr int kMaxDepth = 32;

/// Pool / forest configuration
struct ForestConfig {
    int depth = kDefaultDepth; ///< Depth shared by every tree in a pool
};

[[nodiscard]]
inline auto validate(const ForestConfig& config) -> std::expected<void, std::error_code>
{
    if (config.depth < 1 || config.depth > kMaxDepth) {
        return std::unexpected(make_error_code(Error::InvalidDepth));
    }
    return {};
}

/// 2^depth
[[nodiscard]] constexpr size_t capacity_for(int depth) noexcept
{
    return size_t { 1 } << depth;
}

} // namespace Forest::Core
