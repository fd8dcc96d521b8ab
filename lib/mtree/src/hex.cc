#include "mtree/hex.hpp"
#include "mtree/error.hpp"
#include <iomanip>
#include <sstream>

namespace Mtree::Hex {

namespace {

    int nibble(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

} // namespace

std::string to_hex(BytesSpan data)
{
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (auto b : data) {
        os << std::setw(2) << static_cast<int>(b);
    }
    return os.str();
}

std::string to_hex(const Digest& digest)
{
    return to_hex(BytesSpan(digest));
}

auto digest_from_hex(std::string_view hex) -> std::expected<Digest, std::error_code>
{
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 2 * kDigestSize) {
        return std::unexpected(make_error_code(Error::InvalidHexDigest));
    }

    Digest out {};
    for (size_t i = 0; i < kDigestSize; ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(make_error_code(Error::InvalidHexDigest));
        }
        out[i] = static_cast<Byte>((hi << 4) | lo);
    }
    return out;
}

} // namespace Mtree::Hex
