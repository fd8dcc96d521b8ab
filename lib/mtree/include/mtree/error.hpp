#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Mtree {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyInput, // 构建树时没有任何输入
    UnknownAlgorithm, // 不支持的哈希算法名
    InvalidHexDigest, // 十六进制摘要格式错误
    PathNotFound, // 路径不存在
    ReadFailed, // 文件读取失败或不完整
    DigestFailure, // OpenSSL 摘要计算失败
    InvalidArgument
};

class MtreeErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "mtree"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyInput:
            return "Merkle tree requires at least one element";
        case Error::UnknownAlgorithm:
            return "Unknown hash algorithm";
        case Error::InvalidHexDigest:
            return "Digest must be 64 hexadecimal characters";
        case Error::PathNotFound:
            return "Path does not exist";
        case Error::ReadFailed:
            return "Failed to read file content";
        case Error::DigestFailure:
            return "OpenSSL digest failure";
        case Error::InvalidArgument:
            return "Invalid argument";
        default:
            return "Unknown mtree error";
        }
    }
};

inline const std::error_category& mtree_category()
{
    static MtreeErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), mtree_category() };
}
} // namespace Mtree

namespace std {
template <>
struct is_error_code_enum<Mtree::Error> : true_type { };
} // namespace std
