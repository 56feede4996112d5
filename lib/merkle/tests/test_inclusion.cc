#include "merkle/bundle.hpp"
#include "merkle/codec.hpp"
#include "merkle/proof.hpp"
#include "merkle_test_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace Rektor::Merkle {

// RFC 6962 参考树 (8 个叶子) 的 SHA-256 测试向量
const std::vector<std::string> kInputs = {
    "",
    "00",
    "10",
    "2021",
    "3031",
    "40414243",
    "5051525354555657",
    "606162636465666768696a6b6c6d6e6f",
};

// kRoots[i] 是前 i+1 个叶子构成的树的 root
const std::vector<std::string> kRoots = {
    "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d",
    "fac54203e7cc696cf0dfcb42c92a1d9dbaf70ad9e621f4bd8d98662f00e3c125",
    "aeb6bcfe274b70a14fb067a5e5578264db0fa9b51af5e0ba159158f329e06e77",
    "d37ee418976dd95753c1c73862b9398fa2a2cf9b4ff0fdfe8b30cd95209614b7",
    "4e3bbb1f7b478dcfe71fb631631519a3bca12c9aefca1612bfce4c13a86264d4",
    "76e67dadbcdf1e10e1b74ddc608abd2f98dfb16fbce75277b5232a127f2087ef",
    "ddb89be403809e325750d3d263cd78929c2942b7942a34b77e122c9594a74c8c",
    "5dc9da79a70659a9ad559cb701ded9a2ab9d823aad2f4960cfe370eff4604328",
};

struct PathVector {
    uint64_t index;
    uint64_t size;
    std::vector<std::string> path;
};

const std::vector<PathVector> kPaths = {
    { 0, 1, {} },
    { 0, 8, { "96a296d224f285c67bee93c30f8a309157f0daa35dc5b87e410b78630a09cfc7", "5f083f0a1a33ca076a95279832580db3e0ef4584bdff1f54c8a360f50de3031e", "6b47aaf29ee3c2af9af889bc1fb9254dabd31177f16232dd6aab035ca39bf6e4" } },
    { 5, 8, { "bc1a0643b12e4d2d7c77918f44e0f4f79a838b6cf9ec5b5c283e1f4d88599e6b", "ca854ea128ed050b41b35ffc1b87b8eb2bde461e9e3b5596ece6b9d5975a0ae0", "d37ee418976dd95753c1c73862b9398fa2a2cf9b4ff0fdfe8b30cd95209614b7" } },
    { 2, 3, { "fac54203e7cc696cf0dfcb42c92a1d9dbaf70ad9e621f4bd8d98662f00e3c125" } },
    { 1, 5, { "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d", "5f083f0a1a33ca076a95279832580db3e0ef4584bdff1f54c8a360f50de3031e", "bc1a0643b12e4d2d7c77918f44e0f4f79a838b6cf9ec5b5c283e1f4d88599e6b" } },
};

class InclusionProofTest : public ::testing::Test {
protected:
    const Hasher& hasher = default_hasher();

    static Proof decode(const std::vector<std::string>& hashes)
    {
        Proof proof;
        for (const auto& h : hashes)
            proof.push_back(from_hex(h));
        return proof;
    }
};

TEST_F(InclusionProofTest, Decomposition)
{
    EXPECT_EQ(decompose_inclusion_proof(0, 1).total(), 0U);

    // 满二叉树: 只有 inner
    auto full = decompose_inclusion_proof(3, 8);
    EXPECT_EQ(full.inner, 3U);
    EXPECT_EQ(full.border, 0U);

    // 最后一个叶子在参差的右边界上
    auto ragged = decompose_inclusion_proof(6, 7);
    EXPECT_EQ(ragged.inner, 0U);
    EXPECT_EQ(ragged.border, 2U);

    auto mixed = decompose_inclusion_proof(4, 6);
    EXPECT_EQ(mixed.inner, 1U);
    EXPECT_EQ(mixed.border, 1U);

    static_assert(decompose_inclusion_proof(1, 5).total() == 3);
}

TEST_F(InclusionProofTest, SingleLeafTree)
{
    auto leaf = hasher.hash_leaf(to_bytes("only"));
    EXPECT_TRUE(verify_inclusion(hasher, 0, 1, leaf, Proof {}, leaf).has_value());
}

TEST_F(InclusionProofTest, KnownPaths)
{
    for (const auto& v : kPaths) {
        auto leaf = hasher.hash_leaf(from_hex(kInputs[v.index]));
        auto root = from_hex(kRoots[v.size - 1]);
        auto res = verify_inclusion(hasher, v.index, v.size, leaf, decode(v.path), root);
        EXPECT_TRUE(res.has_value()) << "index " << v.index << " size " << v.size << ": " << res.error().message();
    }
}

TEST_F(InclusionProofTest, ReferenceTreeAllIndices)
{
    ReferenceTree tree(hasher, make_leaves(40));
    for (size_t size = 1; size <= tree.leaf_count(); ++size) {
        auto root = tree.root(size);
        for (size_t index = 0; index < size; ++index) {
            auto proof = tree.inclusion_proof(index, size);
            auto res = verify_inclusion(hasher, index, size, tree.leaf_hash(index), proof, root);
            ASSERT_TRUE(res.has_value()) << "index " << index << " size " << size << ": " << res.error().message();

            auto calculated = root_from_inclusion_proof(hasher, index, size, tree.leaf_hash(index), proof);
            ASSERT_TRUE(calculated.has_value());
            EXPECT_EQ(*calculated, root);
        }
    }
}

// 任意一位被翻转都必须得到 RootMismatch
TEST_F(InclusionProofTest, BitFlipsAreDetected)
{
    ReferenceTree tree(hasher, make_leaves(13));
    const uint64_t size = 13;
    for (uint64_t index = 0; index < size; ++index) {
        const auto leaf = tree.leaf_hash(index);
        const auto proof = tree.inclusion_proof(index, size);
        const auto root = tree.root(size);

        for (size_t bit : { size_t { 0 }, size_t { 77 }, size_t { 255 } }) {
            auto bad_leaf = verify_inclusion(hasher, index, size, flip_bit(leaf, bit), proof, root);
            ASSERT_FALSE(bad_leaf.has_value());
            EXPECT_EQ(bad_leaf.error().code, Error::RootMismatch);

            auto bad_root = verify_inclusion(hasher, index, size, leaf, proof, flip_bit(root, bit));
            ASSERT_FALSE(bad_root.has_value());
            EXPECT_TRUE(bad_root.error().is(ErrorKind::RootMismatch));

            for (size_t i = 0; i < proof.size(); ++i) {
                auto tampered = proof;
                tampered[i] = flip_bit(tampered[i], bit);
                auto bad_proof = verify_inclusion(hasher, index, size, leaf, tampered, root);
                ASSERT_FALSE(bad_proof.has_value());
                EXPECT_TRUE(bad_proof.error().is(ErrorKind::RootMismatch));
            }
        }
    }
}

TEST_F(InclusionProofTest, MismatchCarriesBothRoots)
{
    ReferenceTree tree(hasher, make_leaves(4));
    const auto root = tree.root(4);
    const auto wrong = tree.root(3);

    auto res = verify_inclusion(hasher, 1, 4, tree.leaf_hash(1), tree.inclusion_proof(1, 4), wrong);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().expected_root, hex_encode(wrong));
    EXPECT_EQ(res.error().calculated_root, hex_encode(root));
    EXPECT_NE(res.error().message().find(hex_encode(root)), std::string::npos);
}

TEST_F(InclusionProofTest, ShapeErrors)
{
    ReferenceTree tree(hasher, make_leaves(5));
    const auto leaf = tree.leaf_hash(2);
    const auto proof = tree.inclusion_proof(2, 5);
    const auto root = tree.root(5);

    EXPECT_EQ(verify_inclusion(hasher, 5, 5, leaf, proof, root).error().code, Error::IndexBeyondSize);
    EXPECT_EQ(verify_inclusion(hasher, 0, 0, leaf, Proof {}, root).error().code, Error::IndexBeyondSize);

    Digest short_leaf(leaf.begin(), leaf.end() - 1);
    EXPECT_EQ(verify_inclusion(hasher, 2, 5, short_leaf, proof, root).error().code, Error::LeafHashSize);

    Digest short_root(root.begin(), root.end() - 1);
    EXPECT_EQ(verify_inclusion(hasher, 2, 5, leaf, proof, short_root).error().code, Error::RootHashSize);

    auto bad_element = proof;
    bad_element.back().push_back(0x00);
    EXPECT_EQ(verify_inclusion(hasher, 2, 5, leaf, bad_element, root).error().code, Error::ProofHashSize);

    auto truncated = proof;
    truncated.pop_back();
    EXPECT_EQ(verify_inclusion(hasher, 2, 5, leaf, truncated, root).error().code, Error::WrongProofSize);

    auto extended = proof;
    extended.push_back(proof.front());
    auto res = verify_inclusion(hasher, 2, 5, leaf, extended, root);
    EXPECT_EQ(res.error().code, Error::WrongProofSize);
    EXPECT_TRUE(res.error().is(ErrorKind::InputShape));
    EXPECT_TRUE(res.error().expected_root.empty());
}

TEST_F(InclusionProofTest, RepeatedCallsAgree)
{
    ReferenceTree tree(hasher, make_leaves(9));
    const auto proof = tree.inclusion_proof(7, 9);
    const auto root = tree.root(9);

    auto first = verify_inclusion(hasher, 7, 9, tree.leaf_hash(7), proof, root);
    auto second = verify_inclusion(hasher, 7, 9, tree.leaf_hash(7), proof, root);
    EXPECT_EQ(first.has_value(), second.has_value());

    auto bad_first = verify_inclusion(hasher, 7, 9, tree.leaf_hash(6), proof, root);
    auto bad_second = verify_inclusion(hasher, 7, 9, tree.leaf_hash(6), proof, root);
    ASSERT_FALSE(bad_first.has_value());
    ASSERT_FALSE(bad_second.has_value());
    EXPECT_EQ(bad_first.error().code, bad_second.error().code);
    EXPECT_EQ(bad_first.error().calculated_root, bad_second.error().calculated_root);
}

TEST_F(InclusionProofTest, OtherHashAlgorithm)
{
    auto sha384 = make_hasher("sha384");
    ASSERT_TRUE(sha384.has_value());
    ReferenceTree tree(*sha384, make_leaves(11));
    for (size_t index = 0; index < 11; ++index) {
        EXPECT_TRUE(verify_inclusion(*sha384, index, 11, tree.leaf_hash(index), tree.inclusion_proof(index, 11), tree.root(11)).has_value());
    }

    // SHA-256 长度的 leaf 交给 SHA-384 hasher 是形状错误
    EXPECT_EQ(verify_inclusion(*sha384, 0, 1, hasher.hash_leaf({}), Proof {}, sha384->hash_leaf({})).error().code, Error::LeafHashSize);
}

TEST_F(InclusionProofTest, BundleVerifies)
{
    InclusionBundle bundle {
        .log_index = 5,
        .tree_size = 8,
        .leaf_hash = hex_encode(hasher.hash_leaf(from_hex(kInputs[5]))),
        .hashes = kPaths[2].path,
        .root_hash = kRoots[7],
    };
    EXPECT_TRUE(verify_inclusion(hasher, bundle).has_value());

    bundle.root_hash = kRoots[6];
    auto res = verify_inclusion(hasher, bundle);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is(ErrorKind::RootMismatch));
    EXPECT_EQ(res.error().expected_root, kRoots[6]);
}

// 非法 hex 是解码错误而不是 RootMismatch，并且在形状检查之前报告
TEST_F(InclusionProofTest, BundleDecodingErrors)
{
    InclusionBundle bundle {
        .log_index = 9,
        .tree_size = 8,
        .leaf_hash = hex_encode(hasher.hash_leaf({})),
        .hashes = {},
        .root_hash = "not-hex",
    };
    auto bad_root = verify_inclusion(hasher, bundle);
    ASSERT_FALSE(bad_root.has_value());
    EXPECT_EQ(bad_root.error().code, Error::InvalidHex);
    EXPECT_TRUE(bad_root.error().is(ErrorKind::Decoding));
    EXPECT_FALSE(bad_root.error().is(ErrorKind::RootMismatch));

    bundle.root_hash = kRoots[0];
    bundle.hashes = { "abc" };
    EXPECT_TRUE(verify_inclusion(hasher, bundle).error().is(ErrorKind::Decoding));

    bundle.hashes = {};
    bundle.leaf_hash = "0g";
    EXPECT_TRUE(verify_inclusion(hasher, bundle).error().is(ErrorKind::Decoding));
}

} // namespace Rektor::Merkle
