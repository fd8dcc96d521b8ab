#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Mtree {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;
using Bytes = std::vector<Byte>;

// 所有内置哈希算法的输出宽度
inline constexpr size_t kDigestSize = 32;
using Digest = std::array<Byte, kDigestSize>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline Bytes to_bytes(std::string_view s)
{
    auto span = as_span(s);
    return Bytes(span.begin(), span.end());
}

// OpenSSL 接口需要 unsigned char*
inline const unsigned char* u8ptr(const Byte* p) { return reinterpret_cast<const unsigned char*>(p); }
inline unsigned char* u8ptr(Byte* p) { return reinterpret_cast<unsigned char*>(p); }
inline const unsigned char* u8ptr(BytesSpan s) { return u8ptr(s.data()); }

} // namespace Mtree
