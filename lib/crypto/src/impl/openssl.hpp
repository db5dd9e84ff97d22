#pragma once

#include <memory>
#include <openssl/bn.h>
#include <openssl/evp.h>

namespace Forest::Crypto::impl {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
    decltype([](EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    })>;

using BignumPtr = std::unique_ptr<BIGNUM,
    decltype([](BIGNUM* bn) {
        BN_free(bn);
    })>;

using BnCtxPtr = std::unique_ptr<BN_CTX,
    decltype([](BN_CTX* ctx) {
        BN_CTX_free(ctx);
    })>;

} // namespace Forest::Crypto::impl
