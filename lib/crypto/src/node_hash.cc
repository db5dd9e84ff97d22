#include "crypto/node_hash.hpp"
#include "crypto/field.hpp"
#include "crypto/keccak.hpp"
#include "impl/openssl.hpp"
#include <stdexcept>

namespace Forest::Crypto {
using impl::EvpMdCtxPtr;

namespace {

    // 每个线程一个 ctx，EVP_DigestInit_ex 每次重新初始化
    EVP_MD_CTX* digest_context()
    {
        thread_local const EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw std::runtime_error("OpenSSL EVP_MD_CTX_new failed");
        }
        return ctx.get();
    }

} // namespace

Hash hash_left_right(const Hash& left, const Hash& right)
{
    Hash digest;
    unsigned int len = 0;

    EVP_MD_CTX* ctx = digest_context();
    if (1 != EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)
        || 1 != EVP_DigestUpdate(ctx, &detail::NODE_PREFIX, 1)
        || 1 != EVP_DigestUpdate(ctx, left.data(), left.size())
        || 1 != EVP_DigestUpdate(ctx, right.data(), right.size())
        || 1 != EVP_DigestFinal_ex(ctx, u8ptr(digest.data()), &len)) {
        throw std::runtime_error("OpenSSL SHA-256 digest failed");
    }

    // 输出需落在标量域内，才能作为下一层的输入
    return Field::reduce(digest);
}

const Hash& zero_value()
{
    static const Hash value = Field::reduce(keccak256(as_span(ZERO_VALUE_DOMAIN)));
    return value;
}

} // namespace Forest::Crypto
