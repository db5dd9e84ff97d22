#include "crypto/field.hpp"
#include "impl/openssl.hpp"
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace Forest::Crypto::Field {
using impl::BignumPtr;
using impl::BnCtxPtr;

namespace {

    const BIGNUM* modulus()
    {
        // 只初始化一次，进程结束前不释放
        static const BignumPtr p(BN_bin2bn(SNARK_SCALAR_FIELD.data(), static_cast<int>(SNARK_SCALAR_FIELD.size()), nullptr));
        if (!p) {
            throw std::runtime_error("OpenSSL BN_bin2bn failed for field modulus");
        }
        return p.get();
    }

    // value -= SNARK_SCALAR_FIELD (big-endian, value >= p)
    void subtract_modulus(Hash& value)
    {
        int borrow = 0;
        for (size_t i = HASH_SIZE; i-- > 0;) {
            int diff = static_cast<int>(value[i]) - static_cast<int>(SNARK_SCALAR_FIELD[i]) - borrow;
            borrow = diff < 0 ? 1 : 0;
            value[i] = static_cast<Byte>(diff + (borrow << 8));
        }
    }

} // namespace

Hash reduce(BytesSpan value)
{
    if (value.size() <= HASH_SIZE) {
        // 2^256 < 6p，最多减 5 次
        Hash h = Utils::to_hash(value);
        while (!is_canonical(h)) {
            subtract_modulus(h);
        }
        return h;
    }

    // 更宽的输入走 BIGNUM
    BnCtxPtr ctx(BN_CTX_new());
    BignumPtr a(BN_bin2bn(u8ptr(value), static_cast<int>(value.size()), nullptr));
    BignumPtr r(BN_new());
    if (!ctx || !a || !r) {
        throw std::runtime_error("OpenSSL BIGNUM allocation failed");
    }

    if (1 != BN_mod(r.get(), a.get(), modulus(), ctx.get())) {
        throw std::runtime_error("OpenSSL BN_mod failed");
    }

    Hash out {};
    if (BN_bn2binpad(r.get(), out.data(), static_cast<int>(out.size())) < 0) {
        throw std::runtime_error("OpenSSL BN_bn2binpad failed");
    }
    return out;
}

bool is_canonical(const Hash& value)
{
    // big-endian 字节序比较即数值比较
    return std::lexicographical_compare(value.begin(), value.end(),
        SNARK_SCALAR_FIELD.begin(), SNARK_SCALAR_FIELD.end());
}

} // namespace Forest::Crypto::Field
