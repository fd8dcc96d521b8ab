#pragma once

#include <expected>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

#include "mtree/common.hpp"
#include "mtree/hasher.hpp"
#include "mtree/node.hpp"

namespace Mtree::Fs {

/// Resolves `paths` to the ordered list of regular files that become leaves.
///
/// Files are kept in the given order. A directory is replaced by its entries,
/// sorted by generic path string and expanded recursively, so the same tree
/// contents always yield the same order. Entries that are neither files nor
/// directories are skipped with a warning; a missing path is an error.
[[nodiscard]]
auto collect_files(std::span<const std::filesystem::path> paths)
    -> std::expected<std::vector<std::filesystem::path>, std::error_code>;

// 整个文件读入内存；读取不完整时返回 Error::ReadFailed
[[nodiscard]]
auto read_file(const std::filesystem::path& path) -> std::expected<Bytes, std::error_code>;

// collect_files + read_file + hasher.hash，每个文件一个叶子
[[nodiscard]]
auto hash_paths(const Hasher& hasher, std::span<const std::filesystem::path> paths)
    -> std::expected<std::vector<Node>, std::error_code>;

} // namespace Mtree::Fs
