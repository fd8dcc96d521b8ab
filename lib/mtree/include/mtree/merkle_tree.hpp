#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "mtree/common.hpp"
#include "mtree/config.hpp"
#include "mtree/hasher.hpp"
#include "mtree/node.hpp"

namespace Mtree {

/// Immutable binary Merkle tree.
///
/// Before every combination round a level with an odd number of nodes (more
/// than one) gets a copy of its last node appended. `leaves()` therefore holds
/// the padded leaf level, and `height()` counts levels including the root: one
/// leaf gives height 1, two leaves height 2, ten leaves height 5. It is not the
/// number of combination rounds: three leaves take two rounds and report height 3.
class MerkleTree {
public:
    [[nodiscard]] size_t height() const noexcept { return height_; }

    // 补齐后的叶子数量
    [[nodiscard]] size_t len() const noexcept { return leaves_.size(); }

    // 合法构建的树永远不为空
    [[nodiscard]] bool is_empty() const noexcept { return leaves_.empty(); }

    [[nodiscard]] std::vector<Node> leaves() const { return leaves_; }
    [[nodiscard]] std::vector<Digest> leaf_digests() const;

    [[nodiscard]] Node root() const { return root_; }
    [[nodiscard]] const Digest& root_digest() const noexcept { return root_.digest(); }

private:
    MerkleTree(std::vector<Node> leaves, size_t height, Node root)
        : leaves_(std::move(leaves))
        , height_(height)
        , root_(std::move(root))
    {
    }

    friend auto build_from_leaves(const Hasher& hasher, std::vector<Node> leaves, const BuildConfig& config)
        -> std::expected<MerkleTree, std::error_code>;

    std::vector<Node> leaves_;
    size_t height_;
    Node root_;
};

// 每个 item 成为一个叶子：Leaf(hasher.hash(item))
// 输入为空时返回 Error::EmptyInput
[[nodiscard]]
auto build(const Hasher& hasher, std::span<const Bytes> items, const BuildConfig& config = {})
    -> std::expected<MerkleTree, std::error_code>;

[[nodiscard]]
auto build(const Hasher& hasher, std::span<const std::string> items, const BuildConfig& config = {})
    -> std::expected<MerkleTree, std::error_code>;

// 从已经哈希好的叶子构建
[[nodiscard]]
auto build_from_leaves(const Hasher& hasher, std::vector<Node> leaves, const BuildConfig& config = {})
    -> std::expected<MerkleTree, std::error_code>;

// 文件直接哈希，目录按路径字典序递归展开
[[nodiscard]]
auto build_from_paths(const Hasher& hasher, std::span<const std::filesystem::path> paths, const BuildConfig& config = {})
    -> std::expected<MerkleTree, std::error_code>;

namespace detail {
    // 下一层摘要：对 (level[2i], level[2i+1]) 求 hash_pair，奇数个时最后一个与自身配对
    std::vector<Digest> next_level(const Hasher& hasher, std::span<const Digest> level);

    // 0 表示使用硬件线程数
    size_t resolve_worker_count(const BuildConfig& config);
} // namespace detail

} // namespace Mtree
