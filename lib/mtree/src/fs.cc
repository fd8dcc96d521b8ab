#include "mtree/fs.hpp"
#include "mtree/error.hpp"
#include "mtree/logger.hpp"
#include <algorithm>
#include <fstream>
#include <string>

namespace Mtree::Fs {

namespace fs = std::filesystem;

namespace {

    // 只有调用方直接给出的路径不存在才算错误；目录中的悬空链接直接跳过
    std::error_code collect_into(const fs::path& path, bool top_level, std::vector<fs::path>& out)
    {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            if (!top_level) {
                Logger::instance().warning("Skipping dangling entry: " + path.string());
                return {};
            }
            Logger::instance().error("Path not found: " + path.string());
            return make_error_code(Error::PathNotFound);
        }

        if (fs::is_regular_file(status)) {
            out.push_back(path);
            return {};
        }

        if (!fs::is_directory(status)) {
            Logger::instance().warning("Skipping unsupported file type: " + path.string());
            return {};
        }

        std::vector<fs::path> entries;
        for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            Logger::instance().error("Failed to list directory " + path.string() + ": " + ec.message());
            return ec;
        }

        // 按字典序排序，保证跨平台顺序一致
        std::sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) {
            return a.generic_string() < b.generic_string();
        });

        for (const auto& entry : entries) {
            if (auto err = collect_into(entry, false, out)) {
                return err;
            }
        }
        return {};
    }

} // namespace

auto collect_files(std::span<const fs::path> paths)
    -> std::expected<std::vector<fs::path>, std::error_code>
{
    std::vector<fs::path> files;
    for (const auto& path : paths) {
        if (auto err = collect_into(path, true, files)) {
            return std::unexpected(err);
        }
    }
    return files;
}

auto read_file(const fs::path& path) -> std::expected<Bytes, std::error_code>
{
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return std::unexpected(make_error_code(Error::ReadFailed));
    }

    auto end = in.tellg();
    if (end < 0) {
        return std::unexpected(make_error_code(Error::ReadFailed));
    }
    in.seekg(0, std::ios::beg);

    Bytes content(static_cast<size_t>(end));
    if (!content.empty()
        && !in.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(content.size()))) {
        return std::unexpected(make_error_code(Error::ReadFailed));
    }
    return content;
}

auto hash_paths(const Hasher& hasher, std::span<const fs::path> paths)
    -> std::expected<std::vector<Node>, std::error_code>
{
    auto files = collect_files(paths);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<Node> leaves;
    leaves.reserve(files->size());
    for (const auto& file : *files) {
        auto content = read_file(file);
        if (!content) {
            Logger::instance().error("Failed to read file '" + file.string() + "': " + content.error().message());
            return std::unexpected(content.error());
        }
        leaves.push_back(Node::leaf(hasher.hash(*content)));
        Logger::instance().debug("Hashed " + file.string() + " (" + std::to_string(content->size()) + " bytes)");
    }
    return leaves;
}

} // namespace Mtree::Fs
