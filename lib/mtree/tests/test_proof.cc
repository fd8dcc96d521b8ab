#include "mtree/merkle_tree.hpp"
#include "mtree/proof.hpp"
#include "merkle_test_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <type_traits>
#include <vector>

namespace Mtree {

class ProofTest : public ::testing::Test {
protected:
    EvpHasher sha256 { Algorithm::Sha256 };

    Digest leaf(std::string_view s) const { return sha256.hash(as_span(s)); }
};

// Proofer 持有 hasher 的引用，临时 hasher 必须在编译期被拒绝
static_assert(std::is_constructible_v<Proofer, const EvpHasher&, std::span<const Node>>);
static_assert(std::is_constructible_v<Proofer, const EvpHasher&, std::span<const Digest>>);
static_assert(!std::is_constructible_v<Proofer, EvpHasher, std::span<const Node>>);
static_assert(!std::is_constructible_v<Proofer, EvpHasher, std::span<const Digest>>);
static_assert(!std::is_constructible_v<Proofer, DummyHasher, std::vector<Node>&>);

TEST_F(ProofTest, OutlivesTemporaryLeaves)
{
    auto items = make_items(5);
    auto tree = build(sha256, items);
    ASSERT_TRUE(tree.has_value());

    // leaves() 返回的临时 vector 在构造后即销毁，Proofer 已保存自己的摘要
    Proofer proofer(sha256, tree->leaves());
    auto proof = proofer.generate(4);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proofer.verify(*proof, items[4], tree->root_digest()));
}

// 对每个叶子生成并验证证明
TEST_F(ProofTest, InclusionRoundTrip)
{
    for (size_t n : { 1, 2, 3, 4, 5, 6, 7, 8, 9, 17, 33 }) {
        auto items = make_items(n);
        auto tree = build(sha256, items);
        ASSERT_TRUE(tree.has_value());

        Proofer proofer(sha256, tree->leaves());
        ASSERT_EQ(proofer.root(), tree->root_digest()) << "n = " << n;

        for (size_t i = 0; i < n; ++i) {
            auto proof = proofer.generate(i);
            ASSERT_TRUE(proof.has_value()) << "n = " << n << ", i = " << i;
            EXPECT_EQ(proof->leaf_index, i);
            EXPECT_EQ(proof->path.size(), tree->height() - 1);
            EXPECT_TRUE(proofer.verify(*proof, items[i], tree->root_digest()))
                << "Verification failed for index " << i << " of " << n;
        }
    }
}

// a,b,c,d 的具体向量
TEST_F(ProofTest, ConcreteVector)
{
    std::vector<std::string> data = { "a", "b", "c", "d" };
    auto tree = build(sha256, data);
    ASSERT_TRUE(tree.has_value());

    auto cd = sha256.hash_pair(leaf("c"), leaf("d"));
    auto root = sha256.hash_pair(sha256.hash_pair(leaf("a"), leaf("b")), cd);
    ASSERT_EQ(tree->root_digest(), root);

    Proofer proofer(sha256, tree->leaves());
    auto proof = proofer.generate(0);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 2U);

    EXPECT_EQ(proof->path[0].digest, leaf("b"));
    EXPECT_EQ(proof->path[0].orientation, Orientation::Right);
    EXPECT_EQ(proof->path[1].digest, cd);
    EXPECT_EQ(proof->path[1].orientation, Orientation::Right);

    EXPECT_TRUE(proofer.verify(*proof, as_span("a"), root));
    EXPECT_FALSE(proofer.verify(*proof, as_span("x"), root));
}

TEST_F(ProofTest, OrientationForRightChild)
{
    std::vector<std::string> data = { "a", "b", "c", "d" };
    auto tree = build(sha256, data);
    Proofer proofer(sha256, tree->leaves());

    auto proof = proofer.generate(3);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 2U);

    EXPECT_EQ(proof->path[0].digest, leaf("c"));
    EXPECT_EQ(proof->path[0].orientation, Orientation::Left);
    EXPECT_EQ(proof->path[1].digest, sha256.hash_pair(leaf("a"), leaf("b")));
    EXPECT_EQ(proof->path[1].orientation, Orientation::Left);
}

// 奇数层末尾的节点，兄弟就是它自己的副本
TEST_F(ProofTest, DuplicatedSiblingIsClamped)
{
    std::vector<Digest> leaves = { leaf("a"), leaf("b"), leaf("c") };
    Proofer proofer(sha256, leaves);

    ASSERT_EQ(proofer.leaf_count(), 3U);
    ASSERT_EQ(proofer.levels().size(), 3U);

    auto proof = proofer.generate(2);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 2U);

    EXPECT_EQ(proof->path[0].digest, leaf("c"));
    EXPECT_EQ(proof->path[0].orientation, Orientation::Right);
    EXPECT_EQ(proof->path[1].digest, sha256.hash_pair(leaf("a"), leaf("b")));
    EXPECT_EQ(proof->path[1].orientation, Orientation::Left);

    std::vector<std::string> data = { "a", "b", "c" };
    auto tree = build(sha256, data);
    EXPECT_EQ(proofer.root(), tree->root_digest());
    EXPECT_TRUE(proofer.verify(*proof, as_span("c"), tree->root_digest()));
}

// 未补齐的叶子集合与 tree.leaves()（已补齐）得到同一个根
TEST_F(ProofTest, UnpaddedAndPaddedLeavesAgree)
{
    auto items = make_items(11);
    auto tree = build(sha256, items);

    std::vector<Digest> raw;
    for (const auto& item : items) {
        raw.push_back(sha256.hash(item));
    }

    Proofer from_raw(sha256, raw);
    Proofer from_tree(sha256, tree->leaves());

    EXPECT_EQ(from_raw.root(), tree->root_digest());
    EXPECT_EQ(from_tree.root(), tree->root_digest());
    EXPECT_EQ(from_tree.leaf_count(), 12U);
}

TEST_F(ProofTest, SingleLeafHasEmptyPath)
{
    std::vector<std::string> data = { "only" };
    auto tree = build(sha256, data);
    ASSERT_TRUE(tree.has_value());

    Proofer proofer(sha256, tree->leaves());
    auto proof = proofer.generate(0);
    ASSERT_TRUE(proof.has_value());

    EXPECT_TRUE(proof->path.empty());
    EXPECT_EQ(tree->root_digest(), leaf("only"));
    EXPECT_TRUE(proofer.verify(*proof, as_span("only"), tree->root_digest()));
    EXPECT_FALSE(proofer.verify(*proof, as_span("other"), tree->root_digest()));
}

TEST_F(ProofTest, OutOfBounds)
{
    auto items = make_items(3);
    auto tree = build(sha256, items);
    Proofer proofer(sha256, tree->leaves());

    // 补齐后有 4 个叶子
    EXPECT_TRUE(proofer.generate(3).has_value());
    EXPECT_FALSE(proofer.generate(4).has_value());
    EXPECT_FALSE(proofer.generate(SIZE_MAX).has_value());
}

TEST_F(ProofTest, EmptyProoferHasNoProofs)
{
    std::vector<Digest> none;
    Proofer proofer(sha256, none);

    EXPECT_EQ(proofer.leaf_count(), 0U);
    EXPECT_FALSE(proofer.root().has_value());
    EXPECT_FALSE(proofer.generate(0).has_value());
}

// 数据篡改检测
TEST_F(ProofTest, DetectsTampering)
{
    auto items = make_items(4, "data_");
    auto tree = build(sha256, items);
    auto root = tree->root_digest();
    Proofer proofer(sha256, tree->leaves());
    auto proof = *proofer.generate(1);

    // 场景 A: 验证错误的数据
    auto fake_data = to_bytes("malicious_data");
    EXPECT_FALSE(proofer.verify(proof, fake_data, root)) << "Should fail when data is changed";

    // 场景 A2: 翻转原始数据中的一个字节
    auto flipped = items[1];
    flipped[0] ^= 0x01;
    EXPECT_FALSE(proofer.verify(proof, flipped, root));

    // 场景 B: 验证错误的 Root
    Digest fake_root = root;
    fake_root[0] ^= 0xFF;
    EXPECT_FALSE(proofer.verify(proof, items[1], fake_root)) << "Should fail when root is changed";

    // 场景 C: 其他叶子的数据
    EXPECT_FALSE(proofer.verify(proof, items[0], root));
}

// Proof 篡改检测
TEST_F(ProofTest, DetectsProofTampering)
{
    auto items = make_items(8);
    auto tree = build(sha256, items);
    Proofer proofer(sha256, tree->leaves());
    auto root = tree->root_digest();

    auto original = *proofer.generate(5);
    ASSERT_TRUE(proofer.verify(original, items[5], root));

    for (size_t step = 0; step < original.path.size(); ++step) {
        auto digest_changed = original;
        digest_changed.path[step].digest[0] ^= 0xFF;
        EXPECT_FALSE(proofer.verify(digest_changed, items[5], root)) << "step " << step;

        auto orientation_flipped = original;
        auto& o = orientation_flipped.path[step].orientation;
        o = (o == Orientation::Left) ? Orientation::Right : Orientation::Left;
        EXPECT_FALSE(proofer.verify(orientation_flipped, items[5], root)) << "step " << step;
    }

    auto truncated = original;
    truncated.path.pop_back();
    EXPECT_FALSE(proofer.verify(truncated, items[5], root));

    auto extended = original;
    extended.path.push_back(original.path.back());
    EXPECT_FALSE(proofer.verify(extended, items[5], root));
}

TEST_F(ProofTest, VerifyDigestAndFreeFunctions)
{
    auto items = make_items(6);
    auto tree = build(sha256, items);
    Proofer proofer(sha256, tree->leaves());
    auto root = tree->root_digest();
    auto proof = *proofer.generate(4);

    auto leaf_digest = sha256.hash(items[4]);
    EXPECT_TRUE(proofer.verify_digest(proof, leaf_digest, root));
    EXPECT_TRUE(verify_digest(sha256, proof, leaf_digest, root));
    EXPECT_TRUE(verify(sha256, proof, items[4], root));

    // 用另一个哈希算法验证必然失败
    EvpHasher sha3(Algorithm::Sha3_256);
    EXPECT_FALSE(verify(sha3, proof, items[4], root));
}

TEST_F(ProofTest, DummyHasherProofs)
{
    DummyHasher dummy;
    std::vector<std::string> data = { "a", "b", "c", "d" };
    auto tree = build(dummy, data);
    Proofer proofer(dummy, tree->leaves());

    for (size_t i = 0; i < data.size(); ++i) {
        auto proof = proofer.generate(i);
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(proofer.verify(*proof, as_span(data[i]), tree->root_digest()));
    }
}

TEST_F(ProofTest, LevelsMirrorTreeShape)
{
    auto items = make_items(10);
    auto tree = build(sha256, items);
    Proofer proofer(sha256, tree->leaves());

    ASSERT_EQ(proofer.levels().size(), tree->height());
    EXPECT_EQ(proofer.levels().front().size(), 10U);
    EXPECT_EQ(proofer.levels().back().size(), 1U);
    EXPECT_EQ(proofer.levels().back().front(), tree->root_digest());
}

} // namespace Mtree
