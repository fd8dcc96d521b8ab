#include "mtree/hasher.hpp"
#include "mtree/error.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <openssl/evp.h>
#include <string>

namespace Mtree {

namespace {

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
        decltype([](EVP_MD_CTX* ctx) {
            EVP_MD_CTX_free(ctx);
        })>;

    const EVP_MD* evp_md(Algorithm algo)
    {
        switch (algo) {
        case Algorithm::Sha256:
            return EVP_sha256();
        case Algorithm::Sha3_256:
            return EVP_sha3_256();
        case Algorithm::Blake2s256:
            return EVP_blake2s256();
        }
        return nullptr;
    }

    [[noreturn]] void throw_digest_failure(const char* what)
    {
        throw std::system_error(make_error_code(Error::DigestFailure), what);
    }

    std::string lowercase(std::string_view s)
    {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace

Digest Hasher::hash_pair(const Digest& left, const Digest& right) const
{
    std::array<Byte, 2 * kDigestSize> buf;
    std::memcpy(buf.data(), left.data(), kDigestSize);
    std::memcpy(buf.data() + kDigestSize, right.data(), kDigestSize);
    return hash(buf);
}

std::string_view algorithm_name(Algorithm algo) noexcept
{
    switch (algo) {
    case Algorithm::Sha256:
        return "sha256";
    case Algorithm::Sha3_256:
        return "sha3-256";
    case Algorithm::Blake2s256:
        return "blake2s-256";
    }
    return "unknown";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept
{
    for (auto algo : { Algorithm::Sha256, Algorithm::Sha3_256, Algorithm::Blake2s256 }) {
        if (name == algorithm_name(algo)) {
            return algo;
        }
    }
    return std::nullopt;
}

Digest EvpHasher::hash(BytesSpan data) const
{
    Digest h {};
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw_digest_failure("EVP_MD_CTX_new");
    }

    if (1 != EVP_DigestInit_ex(ctx.get(), evp_md(algo_), nullptr)) {
        throw_digest_failure("EVP_DigestInit_ex");
    }

    // 空输入时 data() 可能为 nullptr，EVP 对长度 0 的更新不解引用
    if (1 != EVP_DigestUpdate(ctx.get(), u8ptr(data), data.size())) {
        throw_digest_failure("EVP_DigestUpdate");
    }

    if (1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(h.data()), &len)) {
        throw_digest_failure("EVP_DigestFinal_ex");
    }

    if (len != kDigestSize) {
        throw_digest_failure("unexpected digest length");
    }

    return h;
}

auto make_hasher(std::string_view name) -> std::expected<std::unique_ptr<Hasher>, std::error_code>
{
    auto key = lowercase(name);
    if (key == "dummy") {
        return std::make_unique<DummyHasher>();
    }
    auto algo = parse_algorithm(key);
    if (!algo) {
        return std::unexpected(make_error_code(Error::UnknownAlgorithm));
    }
    return std::make_unique<EvpHasher>(*algo);
}

} // namespace Mtree
