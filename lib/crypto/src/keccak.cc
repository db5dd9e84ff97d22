#include "crypto/keccak.hpp"
#include <array>
#include <bit>
#include <cstdint>

namespace Forest::Crypto {

namespace {

    constexpr size_t NUM_ROUNDS = 24;
    constexpr size_t NUM_LANES = 25;
    // 1600-bit state, capacity 512 -> rate 136 bytes
    constexpr size_t RATE = 136;

    constexpr std::array<uint64_t, NUM_ROUNDS> ROUND_CONSTANTS = {
        0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
        0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
        0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
        0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
        0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
        0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
    };
    constexpr std::array<int, NUM_ROUNDS> ROT_CONSTANTS = {
        1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
    };
    constexpr std::array<size_t, NUM_ROUNDS> PI_LANES = {
        10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
    };

    using State = std::array<uint64_t, NUM_LANES>;

    void keccak_f(State& st)
    {
        std::array<uint64_t, 5> bc {};

        for (size_t round = 0; round < NUM_ROUNDS; ++round) {
            // theta
            for (size_t i = 0; i < 5; ++i) {
                bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
            }
            for (size_t i = 0; i < 5; ++i) {
                uint64_t t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
                for (size_t j = 0; j < NUM_LANES; j += 5) {
                    st[j + i] ^= t;
                }
            }

            // rho + pi
            uint64_t t = st[1];
            for (size_t i = 0; i < NUM_ROUNDS; ++i) {
                size_t j = PI_LANES[i];
                uint64_t tmp = st[j];
                st[j] = std::rotl(t, ROT_CONSTANTS[i]);
                t = tmp;
            }

            // chi
            for (size_t j = 0; j < NUM_LANES; j += 5) {
                for (size_t i = 0; i < 5; ++i) {
                    bc[i] = st[j + i];
                }
                for (size_t i = 0; i < 5; ++i) {
                    st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // iota
            st[0] ^= ROUND_CONSTANTS[round];
        }
    }

    // lanes are little-endian regardless of host byte order
    void xor_byte(State& st, size_t pos, Byte b)
    {
        st[pos / 8] ^= static_cast<uint64_t>(b) << (8 * (pos % 8));
    }

    Byte read_byte(const State& st, size_t pos)
    {
        return static_cast<Byte>(st[pos / 8] >> (8 * (pos % 8)));
    }

} // namespace

Hash keccak256(BytesSpan data)
{
    State st {};
    size_t pt = 0;

    for (Byte b : data) {
        xor_byte(st, pt, b);
        if (++pt == RATE) {
            keccak_f(st);
            pt = 0;
        }
    }

    xor_byte(st, pt, 0x01);
    xor_byte(st, RATE - 1, 0x80);
    keccak_f(st);

    Hash out;
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = read_byte(st, i);
    }
    return out;
}

} // namespace Forest::Crypto
