#include "crypto/field.hpp"
#include "crypto/node_hash.hpp"
#include "crypto_test_utils.hpp"
#include <cstring>
#include <gtest/gtest.h>

namespace Forest::Crypto {

class NodeHashTest : public ::testing::Test {
protected:
    Hash a = hash_from_hex("0x02");
    Hash b = hash_from_hex("0x04");
};

// keccak256("Railgun") mod SNARK_SCALAR_FIELD
TEST_F(NodeHashTest, ZeroValueMatchesPublishedConstant)
{
    EXPECT_EQ(Utils::to_hex(zero_value()),
        "0488f89b25bc7011eaf6a5edce71aeafb9fe706faa3c0a5cd9cbe868ae3b9ffc");
    EXPECT_EQ(&zero_value(), &zero_value());
}

TEST_F(NodeHashTest, CombineIsOrderedAndDeterministic)
{
    EXPECT_EQ(hash_left_right(a, b), hash_left_right(a, b));
    EXPECT_NE(hash_left_right(a, b), hash_left_right(b, a));
    EXPECT_TRUE(Field::is_canonical(hash_left_right(a, b)));
}

// 测试: 域分离 (Domain Separation)
// hash_left_right 不能等于直接对拼接做 SHA256
TEST_F(NodeHashTest, DomainSeparation)
{
    std::vector<Byte> buf(64);
    std::memcpy(buf.data(), a.data(), 32);
    std::memcpy(buf.data() + 32, b.data(), 32);

    auto direct = sha256(buf);
    EXPECT_NE(hash_left_right(a, b), direct);
    EXPECT_NE(hash_left_right(a, b), Field::reduce(direct)) << "Domain separation is likely missing!";
}

TEST_F(NodeHashTest, FieldReduction)
{
    EXPECT_EQ(Field::reduce(Field::SNARK_SCALAR_FIELD), Hash {});

    Hash p_plus_one = Field::SNARK_SCALAR_FIELD;
    p_plus_one[31] += 1;
    EXPECT_FALSE(Field::is_canonical(p_plus_one));
    EXPECT_EQ(Field::reduce(p_plus_one), hash_from_hex("01"));

    // 小于模数的值保持不变
    EXPECT_EQ(Field::reduce(a), a);

    Hash max {};
    max.fill(0xFF);
    EXPECT_TRUE(Field::is_canonical(Field::reduce(max)));

    // 超过 32 字节的输入按大整数处理
    std::vector<Byte> wide(40, Byte { 0 });
    std::memcpy(wide.data() + 8, Field::SNARK_SCALAR_FIELD.data(), 32);
    wide[39] += 5;
    EXPECT_EQ(Field::reduce(wide), hash_from_hex("05"));
}

// 32 字节输入走减法路径，33 字节输入走 BIGNUM，结果必须一致
TEST_F(NodeHashTest, FixedWidthReductionAgreesWithBignum)
{
    Hash max {};
    max.fill(0xFF);

    Hash two_p_plus_seven = Field::SNARK_SCALAR_FIELD;
    {
        int carry = 0;
        for (size_t i = HASH_SIZE; i-- > 0;) {
            int sum = 2 * Field::SNARK_SCALAR_FIELD[i] + carry + (i == HASH_SIZE - 1 ? 7 : 0);
            two_p_plus_seven[i] = static_cast<Byte>(sum & 0xFF);
            carry = sum >> 8;
        }
    }
    EXPECT_EQ(Field::reduce(two_p_plus_seven), hash_from_hex("07"));

    for (const Hash& value : { max, two_p_plus_seven, Field::SNARK_SCALAR_FIELD, a }) {
        std::vector<Byte> wide(HASH_SIZE + 1, Byte { 0 });
        std::memcpy(wide.data() + 1, value.data(), HASH_SIZE);
        EXPECT_EQ(Field::reduce(value), Field::reduce(wide)) << Utils::to_hex(value);
    }
}

TEST(ByteUtilsTest, HexConversions)
{
    auto bytes = bytes_from_hex("0x00ff10Ab");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<Byte> { 0x00, 0xFF, 0x10, 0xAB }));
    EXPECT_EQ(Utils::to_hex(*bytes), "00ff10ab");

    auto odd = bytes_from_hex("abc");
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error(), std::errc::invalid_argument);
    EXPECT_FALSE(bytes_from_hex("zz").has_value());
}

TEST(ByteUtilsTest, ByteLength)
{
    std::vector<Byte> data = { 0x01, 0x02, 0x03 };
    EXPECT_EQ(Utils::to_byte_length(data, 5), (std::vector<Byte> { 0x00, 0x00, 0x01, 0x02, 0x03 }));
    EXPECT_EQ(Utils::to_byte_length(data, 2), (std::vector<Byte> { 0x02, 0x03 }));

    Hash h = Utils::to_hash(data);
    EXPECT_EQ(h[29], 0x01);
    EXPECT_EQ(h[31], 0x03);
    EXPECT_EQ(h[0], 0x00);
}

} // namespace Forest::Crypto
