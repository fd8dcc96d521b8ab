#include "mtree/merkle_tree.hpp"
#include "mtree/error.hpp"
#include "mtree/fs.hpp"
#include "mtree/logger.hpp"
#include "mtree/thread_pool.hpp"
#include <algorithm>
#include <future>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace Mtree {

namespace {

    // 把 [0, count) 切成连续区间交给线程池，按区间顺序拼接结果
    // produce(begin, end, out) 只能访问自己区间内的数据
    template <typename T, typename F>
    std::vector<T> scatter_gather(ThreadPool* pool, size_t count, const F& produce)
    {
        std::vector<T> out;
        out.reserve(count);

        if (pool == nullptr || pool->size() < 2 || count < 2) {
            produce(0, count, out);
            return out;
        }

        size_t chunks = std::min(pool->size(), count);
        size_t per_chunk = (count + chunks - 1) / chunks;

        std::vector<std::future<std::vector<T>>> futures;
        futures.reserve(chunks);
        for (size_t begin = 0; begin < count; begin += per_chunk) {
            size_t end = std::min(begin + per_chunk, count);
            futures.push_back(pool->submit([&produce, begin, end] {
                std::vector<T> part;
                part.reserve(end - begin);
                produce(begin, end, part);
                return part;
            }));
        }

        // 先等全部完成再取结果：任务引用了调用方的数据，不能提前抛出
        for (auto& f : futures) {
            f.wait();
        }
        for (auto& f : futures) {
            auto part = f.get();
            std::move(part.begin(), part.end(), std::back_inserter(out));
        }
        return out;
    }

    std::optional<ThreadPool> make_pool(const BuildConfig& config, size_t widest_level)
    {
        size_t workers = detail::resolve_worker_count(config);
        if (workers < 2 || widest_level < std::max<size_t>(config.parallel_threshold, 2)) {
            return std::nullopt;
        }
        return std::optional<ThreadPool>(std::in_place, workers);
    }

    template <typename T>
    void pad_level(std::vector<T>& level)
    {
        if (level.size() > 1 && level.size() % 2 != 0) {
            level.push_back(level.back());
        }
    }

    std::vector<Node> combine_level(const Hasher& hasher, std::vector<Node>& level, ThreadPool* pool, size_t threshold)
    {
        size_t pairs = level.size() / 2;
        ThreadPool* level_pool = pairs >= threshold ? pool : nullptr;

        return scatter_gather<Node>(level_pool, pairs, [&](size_t begin, size_t end, std::vector<Node>& out) {
            for (size_t i = begin; i < end; ++i) {
                out.push_back(Node::internal(hasher, std::move(level[2 * i]), std::move(level[2 * i + 1])));
            }
        });
    }

} // namespace

namespace detail {

    std::vector<Digest> next_level(const Hasher& hasher, std::span<const Digest> level)
    {
        std::vector<Digest> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            // 奇数层的最后一个节点与其副本配对
            const Digest& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
            next.push_back(hasher.hash_pair(level[i], right));
        }
        return next;
    }

    size_t resolve_worker_count(const BuildConfig& config)
    {
        if (config.worker_threads != 0) {
            return config.worker_threads;
        }
        return std::max(1U, std::thread::hardware_concurrency());
    }

} // namespace detail

std::vector<Digest> MerkleTree::leaf_digests() const
{
    std::vector<Digest> digests;
    digests.reserve(leaves_.size());
    for (const auto& leaf : leaves_) {
        digests.push_back(leaf.digest());
    }
    return digests;
}

auto build_from_leaves(const Hasher& hasher, std::vector<Node> leaves, const BuildConfig& config)
    -> std::expected<MerkleTree, std::error_code>
{
    if (leaves.empty()) {
        return std::unexpected(make_error_code(Error::EmptyInput));
    }

    pad_level(leaves);
    std::vector<Node> padded_leaves = leaves;

    auto pool = make_pool(config, leaves.size() / 2);
    ThreadPool* pool_ptr = pool ? &*pool : nullptr;

    std::vector<Node> level = std::move(leaves);
    size_t rounds = 0;

    // 第 i+1 层必须等第 i 层全部完成；同一层内的各对可以并行
    while (level.size() > 1) {
        pad_level(level);
        level = combine_level(hasher, level, pool_ptr, config.parallel_threshold);
        ++rounds;
    }

    Logger::instance().debug("Built merkle tree with " + std::to_string(padded_leaves.size())
        + " leaves, height " + std::to_string(rounds + 1) + " using " + std::string(hasher.name()));

    Node root = std::move(level.front());
    return MerkleTree(std::move(padded_leaves), rounds + 1, std::move(root));
}

auto build(const Hasher& hasher, std::span<const Bytes> items, const BuildConfig& config)
    -> std::expected<MerkleTree, std::error_code>
{
    if (items.empty()) {
        return std::unexpected(make_error_code(Error::EmptyInput));
    }

    auto pool = make_pool(config, items.size());
    auto leaves = scatter_gather<Node>(pool ? &*pool : nullptr, items.size(),
        [&](size_t begin, size_t end, std::vector<Node>& out) {
            for (size_t i = begin; i < end; ++i) {
                out.push_back(Node::leaf(hasher.hash(items[i])));
            }
        });
    pool.reset();

    return build_from_leaves(hasher, std::move(leaves), config);
}

auto build(const Hasher& hasher, std::span<const std::string> items, const BuildConfig& config)
    -> std::expected<MerkleTree, std::error_code>
{
    std::vector<Bytes> bytes;
    bytes.reserve(items.size());
    for (const auto& item : items) {
        bytes.push_back(to_bytes(item));
    }
    return build(hasher, std::span<const Bytes>(bytes), config);
}

auto build_from_paths(const Hasher& hasher, std::span<const std::filesystem::path> paths, const BuildConfig& config)
    -> std::expected<MerkleTree, std::error_code>
{
    auto leaves = Fs::hash_paths(hasher, paths);
    if (!leaves) {
        return std::unexpected(leaves.error());
    }
    return build_from_leaves(hasher, std::move(*leaves), config);
}

} // namespace Mtree
