#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "mtree/config.hpp"
#include "mtree/hasher.hpp"

namespace Mtree::Cli {

inline constexpr int kExitVerified = 0;
inline constexpr int kExitNotVerified = 1;
inline constexpr int kExitUsage = 2;

// --threads 的上限
inline constexpr size_t kMaxThreads = 4096;

struct CommandLineOptions {
    std::string command;
    std::string hash = "sha256";
    std::string log_level;
    std::optional<std::string> root;
    size_t index = 0;
    BuildConfig build;
    std::vector<std::filesystem::path> paths;
    bool help = false;
};

// 只接受十进制数字，拒绝符号、空白和溢出
[[nodiscard]] std::optional<size_t> parse_size(std::string_view text);

// 解析失败返回 nullopt，错误已经写入日志
[[nodiscard]] std::optional<CommandLineOptions> parse_args(int argc, char* argv[]);

int run_root(const Hasher& hasher, const CommandLineOptions& options, std::ostream& out);
int run_prove(const Hasher& hasher, const CommandLineOptions& options, std::ostream& out);

/// Full command-line entry point: reads `MTREE_LOG_LEVEL`, parses `argv`,
/// dispatches to `root` or `prove` and returns the process exit code.
/// Results go to `out`; usage text and logs go to stderr.
int run(int argc, char* argv[], std::ostream& out);

} // namespace Mtree::Cli
