#include "cli.hpp"

#include "mtree/error.hpp"
#include "mtree/fs.hpp"
#include "mtree/hex.hpp"
#include "mtree/logger.hpp"
#include "mtree/merkle_tree.hpp"
#include "mtree/proof.hpp"

#include <charconv>
#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <iostream>

namespace Mtree::Cli {

namespace {

    void print_usage(const char* program)
    {
        std::cerr << "Usage:\n"
                  << "  " << program << " root  [options] <path>...\n"
                  << "  " << program << " prove [options] --root <hex> [--index <n>] <path>...\n"
                  << "\n"
                  << "Options:\n"
                  << "  -a, --hash <name>       sha256 (default), sha3-256, blake2s-256, dummy\n"
                  << "  -t, --threads <n>       worker threads (max " << kMaxThreads << "), 0 = all cores (default), 1 = sequential\n"
                  << "  -r, --root <hex>        expected root digest (prove)\n"
                  << "  -i, --index <n>         leaf to prove, default 0 (prove)\n"
                  << "  -l, --log-level <lvl>   trace, debug, info, warning, error, critical\n"
                  << "  -h, --help              show this message\n"
                  << "\n"
                  << "Directories are expanded recursively in lexicographic order.\n"
                  << "MTREE_LOG_LEVEL sets the default log level.\n";
    }

    bool apply_log_level(std::string_view name)
    {
        auto level = parse_log_level(name);
        if (!level) {
            Logger::instance().error("Unknown log level: " + std::string(name));
            return false;
        }
        Logger::instance().set_level(*level);
        return true;
    }

} // namespace

std::optional<size_t> parse_size(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc {} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<CommandLineOptions> parse_args(int argc, char* argv[])
{
    CommandLineOptions options;

    static struct option long_options[] = {
        { "hash", required_argument, nullptr, 'a' },
        { "threads", required_argument, nullptr, 't' },
        { "root", required_argument, nullptr, 'r' },
        { "index", required_argument, nullptr, 'i' },
        { "log-level", required_argument, nullptr, 'l' },
        { "help", no_argument, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 }
    };

    int opt;
    int option_index = 0;

    // 0 让 glibc 完全重新初始化，parse_args 可以被多次调用
    optind = 0;

    while ((opt = getopt_long(argc, argv, "a:t:r:i:l:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'a':
            options.hash = optarg;
            break;
        case 't': {
            auto n = parse_size(optarg);
            if (!n || *n > kMaxThreads) {
                Logger::instance().error("Invalid thread count: " + std::string(optarg)
                    + " (expected 0.." + std::to_string(kMaxThreads) + ")");
                return std::nullopt;
            }
            options.build.worker_threads = *n;
            break;
        }
        case 'r':
            options.root = optarg;
            break;
        case 'i': {
            auto n = parse_size(optarg);
            if (!n) {
                Logger::instance().error("Invalid leaf index: " + std::string(optarg));
                return std::nullopt;
            }
            options.index = *n;
            break;
        }
        case 'l':
            options.log_level = optarg;
            break;
        case 'h':
            options.help = true;
            break;
        default:
            return std::nullopt;
        }
    }

    if (optind < argc) {
        options.command = argv[optind++];
    }
    for (; optind < argc; ++optind) {
        options.paths.emplace_back(argv[optind]);
    }
    return options;
}

int run_root(const Hasher& hasher, const CommandLineOptions& options, std::ostream& out)
{
    auto tree = build_from_paths(hasher, options.paths, options.build);
    if (!tree) {
        Logger::instance().error("Failed to build tree: " + tree.error().message());
        return kExitUsage;
    }

    Logger::instance().info("Tree has " + std::to_string(tree->len()) + " leaves and height "
        + std::to_string(tree->height()));
    out << Hex::to_hex(tree->root_digest()) << std::endl;
    return kExitVerified;
}

int run_prove(const Hasher& hasher, const CommandLineOptions& options, std::ostream& out)
{
    if (!options.root) {
        Logger::instance().error("prove requires --root <hex>");
        return kExitUsage;
    }
    auto root = Hex::digest_from_hex(*options.root);
    if (!root) {
        Logger::instance().error("Invalid root digest '" + *options.root + "': " + root.error().message());
        return kExitUsage;
    }

    auto leaves = Fs::hash_paths(hasher, options.paths);
    if (!leaves) {
        Logger::instance().error("Failed to hash inputs: " + leaves.error().message());
        return kExitUsage;
    }
    if (leaves->empty()) {
        Logger::instance().error(make_error_code(Error::EmptyInput).message());
        return kExitUsage;
    }

    Proofer proofer(hasher, *leaves);
    auto proof = proofer.generate(options.index);
    if (!proof) {
        Logger::instance().error("Leaf index " + std::to_string(options.index) + " is out of range ("
            + std::to_string(proofer.leaf_count()) + " leaves)");
        return kExitUsage;
    }

    for (const auto& step : proof->path) {
        out << orientation_name(step.orientation) << ' ' << Hex::to_hex(step.digest) << '\n';
    }

    bool ok = proofer.verify_digest(*proof, (*leaves)[options.index].digest(), *root);
    out << (ok ? "true" : "false") << std::endl;
    return ok ? kExitVerified : kExitNotVerified;
}

int run(int argc, char* argv[], std::ostream& out)
{
    if (const char* env_level = std::getenv("MTREE_LOG_LEVEL")) {
        if (!apply_log_level(env_level)) {
            return kExitUsage;
        }
    }

    const char* program = argc > 0 ? argv[0] : "mtree";

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(program);
        return kExitUsage;
    }
    if (options->help) {
        print_usage(program);
        return kExitVerified;
    }
    if (!options->log_level.empty() && !apply_log_level(options->log_level)) {
        return kExitUsage;
    }
    if (options->command.empty() || options->paths.empty()) {
        print_usage(program);
        return kExitUsage;
    }

    auto hasher = make_hasher(options->hash);
    if (!hasher) {
        Logger::instance().error("Unknown hash algorithm: " + options->hash);
        return kExitUsage;
    }

    try {
        if (options->command == "root") {
            return run_root(**hasher, *options, out);
        }
        if (options->command == "prove") {
            return run_prove(**hasher, *options, out);
        }
    } catch (const std::exception& e) {
        // 线程创建失败、OpenSSL 失败等
        Logger::instance().critical(e.what());
        return kExitUsage;
    }

    Logger::instance().error("Unknown command: " + options->command);
    print_usage(program);
    return kExitUsage;
}

} // namespace Mtree::Cli
