#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>

#include "mtree/common.hpp"

namespace Mtree {

class Hasher;

/// Element of a Merkle tree: a leaf holding Hash(data), or an internal node
/// holding Hash(left.digest || right.digest) and owning both children.
class Node {
public:
    struct Leaf { };
    struct Internal {
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    [[nodiscard]] static Node leaf(const Digest& digest);

    // 摘要由 hasher 根据左右孩子计算，保证内部节点不变式
    [[nodiscard]] static Node internal(const Hasher& hasher, Node left, Node right);

    // 拷贝为深拷贝（奇数层复制最后一个节点时需要）
    Node(const Node& other);
    Node& operator=(const Node& other);
    Node(Node&&) noexcept = default;
    Node& operator=(Node&&) noexcept = default;
    ~Node() = default;

    [[nodiscard]] const Digest& digest() const noexcept { return digest_; }
    [[nodiscard]] bool is_leaf() const noexcept { return std::holds_alternative<Leaf>(kind_); }

    // 叶子节点返回 nullptr
    [[nodiscard]] const Node* left() const noexcept;
    [[nodiscard]] const Node* right() const noexcept;

    // 子树中的节点总数（含自身）
    [[nodiscard]] size_t size() const noexcept;

private:
    Node(const Digest& digest, std::variant<Leaf, Internal> kind)
        : digest_(digest)
        , kind_(std::move(kind))
    {
    }

    Digest digest_;
    std::variant<Leaf, Internal> kind_;
};

} // namespace Mtree
