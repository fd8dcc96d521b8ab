#include "mtree/node.hpp"
#include "mtree/hasher.hpp"
#include <utility>

namespace Mtree {

namespace {

    std::variant<Node::Leaf, Node::Internal> clone_kind(const std::variant<Node::Leaf, Node::Internal>& kind)
    {
        if (const auto* internal = std::get_if<Node::Internal>(&kind)) {
            return Node::Internal {
                .left = std::make_unique<Node>(*internal->left),
                .right = std::make_unique<Node>(*internal->right)
            };
        }
        return Node::Leaf {};
    }

} // namespace

Node Node::leaf(const Digest& digest)
{
    return Node(digest, Leaf {});
}

Node Node::internal(const Hasher& hasher, Node left, Node right)
{
    Digest digest = hasher.hash_pair(left.digest(), right.digest());
    return Node(digest, Internal {
                            .left = std::make_unique<Node>(std::move(left)),
                            .right = std::make_unique<Node>(std::move(right)) });
}

Node::Node(const Node& other)
    : digest_(other.digest_)
    , kind_(clone_kind(other.kind_))
{
}

Node& Node::operator=(const Node& other)
{
    if (this != &other) {
        Node tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

const Node* Node::left() const noexcept
{
    if (const auto* internal = std::get_if<Internal>(&kind_)) {
        return internal->left.get();
    }
    return nullptr;
}

const Node* Node::right() const noexcept
{
    if (const auto* internal = std::get_if<Internal>(&kind_)) {
        return internal->right.get();
    }
    return nullptr;
}

size_t Node::size() const noexcept
{
    if (const auto* internal = std::get_if<Internal>(&kind_)) {
        return 1 + internal->left->size() + internal->right->size();
    }
    return 1;
}

} // namespace Mtree
