#include "mtree/proof.hpp"
#include "mtree/merkle_tree.hpp"
#include <algorithm>
#include <bit>
#include <utility>

namespace Mtree {

std::string_view orientation_name(Orientation o) noexcept
{
    return o == Orientation::Left ? "L" : "R";
}

Proofer::Proofer(const Hasher& hasher, std::span<const Node> leaves)
    : hasher_(hasher)
{
    std::vector<Digest> digests;
    digests.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        digests.push_back(leaf.digest());
    }
    compute_levels(std::move(digests));
}

Proofer::Proofer(const Hasher& hasher, std::span<const Digest> leaf_digests)
    : hasher_(hasher)
{
    compute_levels(std::vector<Digest>(leaf_digests.begin(), leaf_digests.end()));
}

void Proofer::compute_levels(std::vector<Digest> leaves)
{
    if (leaves.empty()) {
        return;
    }

    levels_.reserve(static_cast<size_t>(std::bit_width(leaves.size())) + 1);
    levels_.push_back(std::move(leaves));

    while (levels_.back().size() > 1) {
        auto next = detail::next_level(hasher_, levels_.back());
        levels_.push_back(std::move(next));
    }
}

std::optional<Digest> Proofer::root() const
{
    if (levels_.empty()) {
        return std::nullopt;
    }
    return levels_.back().front();
}

std::optional<MerkleProof> Proofer::generate(size_t index) const
{
    if (index >= leaf_count()) {
        return std::nullopt;
    }

    std::vector<ProofNode> path;
    path.reserve(levels_.size() - 1);

    size_t current = index;

    // 最后一层是根，不需要兄弟
    for (size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
        const auto& level = levels_[depth];

        // current^1 是兄弟 (偶数+1, 奇数-1)
        // 奇数层末尾的节点没有兄弟，此时兄弟是它自己的副本
        size_t sibling = std::min(current ^ 1, level.size() - 1);

        path.push_back(ProofNode {
            .digest = level[sibling],
            .orientation = sibling < current ? Orientation::Left : Orientation::Right });

        current >>= 1;
    }

    return MerkleProof {
        .leaf_index = index,
        .path = std::move(path)
    };
}

bool Proofer::verify(const MerkleProof& proof, BytesSpan data, const Digest& root) const
{
    return Mtree::verify(hasher_, proof, data, root);
}

bool Proofer::verify_digest(const MerkleProof& proof, const Digest& leaf_digest, const Digest& root) const
{
    return Mtree::verify_digest(hasher_, proof, leaf_digest, root);
}

bool verify(const Hasher& hasher, const MerkleProof& proof, BytesSpan data, const Digest& root)
{
    return verify_digest(hasher, proof, hasher.hash(data), root);
}

bool verify_digest(const Hasher& hasher, const MerkleProof& proof, const Digest& leaf_digest, const Digest& root)
{
    Digest acc = leaf_digest;

    for (const auto& step : proof.path) {
        if (step.orientation == Orientation::Left) {
            // Hash(sibling || acc)
            acc = hasher.hash_pair(step.digest, acc);
        } else {
            // Hash(acc || sibling)
            acc = hasher.hash_pair(acc, step.digest);
        }
    }

    return acc == root;
}

} // namespace Mtree
