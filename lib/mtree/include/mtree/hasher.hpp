#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

#include "mtree/common.hpp"

namespace Mtree {

/// Reduces an arbitrary byte sequence to a fixed-size digest.
///
/// Implementations must be pure and keep no observable mutable state: a single
/// instance is shared by every worker thread while a tree is being built.
class Hasher {
public:
    virtual ~Hasher() = default;

    [[nodiscard]] virtual Digest hash(BytesSpan data) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Hash(left || right)，内部节点与证明校验共用
    [[nodiscard]] Digest hash_pair(const Digest& left, const Digest& right) const;
};

// 测试用：任何输入都返回同一个摘要
class DummyHasher final : public Hasher {
public:
    static constexpr Digest kDigest { 0xc0, 0xff, 0xee };

    [[nodiscard]] Digest hash(BytesSpan) const override { return kDigest; }
    [[nodiscard]] std::string_view name() const noexcept override { return "dummy"; }
};

enum class Algorithm : std::uint8_t {
    Sha256,
    Sha3_256,
    Blake2s256
};

[[nodiscard]] std::string_view algorithm_name(Algorithm algo) noexcept;
[[nodiscard]] std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept;

// OpenSSL EVP 实现。每次调用新建 EVP_MD_CTX，因此可以跨线程共享
class EvpHasher final : public Hasher {
public:
    explicit EvpHasher(Algorithm algo)
        : algo_(algo)
    {
    }

    // 失败时抛出 std::system_error(Error::DigestFailure)
    [[nodiscard]] Digest hash(BytesSpan data) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return algorithm_name(algo_); }

    [[nodiscard]] Algorithm algorithm() const noexcept { return algo_; }

private:
    Algorithm algo_;
};

[[nodiscard]]
auto make_hasher(std::string_view name) -> std::expected<std::unique_ptr<Hasher>, std::error_code>;

} // namespace Mtree
