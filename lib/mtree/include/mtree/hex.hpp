#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "mtree/common.hpp"

namespace Mtree::Hex {

// 小写十六进制
[[nodiscard]] std::string to_hex(BytesSpan data);
[[nodiscard]] std::string to_hex(const Digest& digest);

// 接受 64 个十六进制字符（大小写均可），可带 "0x" 前缀
[[nodiscard]]
auto digest_from_hex(std::string_view hex) -> std::expected<Digest, std::error_code>;

} // namespace Mtree::Hex
