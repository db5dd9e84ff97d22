#include "core/proof_codec.hpp"
#include "merkle_test_utils.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace Forest::Core::MerkleTree {

class ProofCodecTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto created = SparseTree::create(0, 5);
        ASSERT_TRUE(created.has_value());
        auto leaves = make_leaves(9, 0x40);
        ASSERT_TRUE(created->insert_leaves(leaves, 0));
        created->rebuild_sparse_tree();
        auto generated = created->generate_proof(leaves[6]);
        ASSERT_TRUE(generated.has_value());
        proof = std::move(*generated);
    }

    Proof proof;
};

TEST_F(ProofCodecTest, LayoutAndRoundTrip)
{
    auto bytes = encode_proof(proof);
    ASSERT_EQ(bytes.size(), encoded_proof_size(5));
    EXPECT_EQ(bytes.size(), 32U + 1U + (5U * 32U) + 8U + 32U);

    // element | depth | ... | indices (LE) | root
    EXPECT_TRUE(std::equal(proof.element.begin(), proof.element.end(), bytes.begin()));
    EXPECT_EQ(bytes[32], 5U);
    EXPECT_EQ(bytes[33 + (5 * 32)], 6U);
    EXPECT_TRUE(std::equal(proof.root.begin(), proof.root.end(), bytes.end() - 32));

    auto decoded = decode_proof(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, proof);
    EXPECT_TRUE(validate_proof(*decoded));
}

TEST_F(ProofCodecTest, RejectsMalformedInput)
{
    auto bytes = encode_proof(proof);

    std::vector<Byte> truncated(bytes.begin(), bytes.end() - 1);
    auto short_result = decode_proof(truncated);
    ASSERT_FALSE(short_result.has_value());
    EXPECT_EQ(short_result.error(), Error::MalformedProof);

    auto zero_depth = bytes;
    zero_depth[32] = 0;
    auto zero_result = decode_proof(zero_depth);
    ASSERT_FALSE(zero_result.has_value());
    EXPECT_EQ(zero_result.error(), Error::MalformedProof);

    std::vector<Byte> tiny(10, Byte { 0 });
    EXPECT_FALSE(decode_proof(tiny).has_value());
}

// 传输中被篡改的 proof 解码成功但验证失败
TEST_F(ProofCodecTest, TamperedEncodingFailsValidation)
{
    auto bytes = encode_proof(proof);
    bytes[33 + 32 + 5] ^= 0x04; // second sibling

    auto decoded = decode_proof(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(validate_proof(*decoded));
}

} // namespace Forest::Core::MerkleTree
