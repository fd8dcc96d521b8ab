#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "mtree/common.hpp"
#include "mtree/hasher.hpp"
#include "mtree/node.hpp"

namespace Mtree {

// 兄弟节点在计算父节点时是左操作数还是右操作数
enum class Orientation : std::uint8_t {
    Left,
    Right
};

[[nodiscard]] std::string_view orientation_name(Orientation o) noexcept;

struct ProofNode {
    Digest digest;
    Orientation orientation;
};

struct MerkleProof {
    size_t leaf_index;
    std::vector<ProofNode> path; // 从叶子到根（不含根）
};

/**
 * @brief Generates and checks inclusion proofs over a fixed leaf set.
 *
 * Every level of the tree is recomputed on construction with the same padding
 * rule as `build()` and kept in memory. The hasher is held by reference and
 * must outlive the proofer.
 */
class Proofer {
public:
    Proofer(const Hasher& hasher, std::span<const Node> leaves);
    Proofer(const Hasher& hasher, std::span<const Digest> leaf_digests);

    // 只保存 hasher 的引用，不能绑定临时对象
    Proofer(const Hasher&&, std::span<const Node>) = delete;
    Proofer(const Hasher&&, std::span<const Digest>) = delete;

    // index 越界时返回 std::nullopt
    [[nodiscard]] std::optional<MerkleProof> generate(size_t index) const;

    [[nodiscard]] bool verify(const MerkleProof& proof, BytesSpan data, const Digest& root) const;
    [[nodiscard]] bool verify_digest(const MerkleProof& proof, const Digest& leaf_digest, const Digest& root) const;

    [[nodiscard]] size_t leaf_count() const noexcept { return levels_.empty() ? 0 : levels_.front().size(); }

    // levels()[0] 是叶子层，最后一层只有根
    [[nodiscard]] const std::vector<std::vector<Digest>>& levels() const noexcept { return levels_; }

    // 没有叶子时返回 std::nullopt
    [[nodiscard]] std::optional<Digest> root() const;

private:
    void compute_levels(std::vector<Digest> leaves);

    const Hasher& hasher_;
    std::vector<std::vector<Digest>> levels_;
};

// 不需要叶子集合，只需要 root
[[nodiscard]]
bool verify(const Hasher& hasher, const MerkleProof& proof, BytesSpan data, const Digest& root);

[[nodiscard]]
bool verify_digest(const Hasher& hasher, const MerkleProof& proof, const Digest& leaf_digest, const Digest& root);

} // namespace Mtree
