#include "cli/cli.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "audit/config.hpp"
#include "audit/logging.hpp"
#include "merkle/bundle.hpp"
#include "merkle/codec.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/leaf.hpp"

namespace Rektor::Cli {
namespace {

using Flags = std::map<std::string, std::vector<std::string>, std::less<>>;

struct Options {
    std::optional<std::filesystem::path> config;
    bool debug = false;
    std::string command;
    Flags flags;
};

std::optional<Options> parse_args(int argc, const char* const argv[], std::ostream& err)
{
    Options opts;
    int i = 1;

    // 全局参数在命令之前
    for (; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                err << "Error: --config requires a value\n";
                return std::nullopt;
            }
            opts.config = argv[++i];
        } else if (arg.starts_with("--")) {
            err << "Error: unknown option " << arg << "\n";
            return std::nullopt;
        } else {
            break;
        }
    }

    if (i >= argc) {
        return std::nullopt;
    }
    opts.command = argv[i++];

    for (; i < argc; i += 2) {
        std::string_view flag = argv[i];
        if (!flag.starts_with("--") || i + 1 >= argc) {
            err << "Error: flag " << flag << " requires a value\n";
            return std::nullopt;
        }
        opts.flags[std::string(flag.substr(2))].emplace_back(argv[i + 1]);
    }
    return opts;
}

std::optional<std::string> single(const Flags& flags, std::string_view name)
{
    auto it = flags.find(name);
    if (it == flags.end() || it->second.size() != 1) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<std::string> all(const Flags& flags, std::string_view name)
{
    auto it = flags.find(name);
    return it == flags.end() ? std::vector<std::string> {} : it->second;
}

std::optional<uint64_t> parse_u64(std::string_view s)
{
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc {} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// 只允许出现已知的 flag，避免拼写错误被静默忽略
bool only_known(const Flags& flags, std::initializer_list<std::string_view> known, std::ostream& err)
{
    for (const auto& [name, _] : flags) {
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            err << "Error: unknown flag --" << name << "\n";
            return false;
        }
    }
    return true;
}

int report(const Merkle::VerifyResult& res, std::string_view success, std::ostream& out, std::ostream& err)
{
    if (res) {
        out << success << "\n";
        return EXIT_VERIFIED;
    }
    if (res.error().is(Merkle::ErrorKind::RootMismatch)) {
        err << "Verification failed: " << res.error().message() << "\n";
        return EXIT_REJECTED;
    }
    err << "Error: " << res.error().message() << "\n";
    return EXIT_BAD_INPUT;
}

int run_leaf_hash(const Merkle::Hasher& hasher, const Flags& flags, std::ostream& out, std::ostream& err)
{
    auto body = single(flags, "body");
    if (!only_known(flags, { "body" }, err) || !body) {
        err << "Error: leaf-hash requires exactly one --body\n";
        return EXIT_BAD_INPUT;
    }

    auto leaf = Merkle::compute_leaf_hash(hasher, *body);
    if (!leaf) {
        err << "Error: " << leaf.error().message() << "\n";
        return EXIT_BAD_INPUT;
    }
    out << Merkle::hex_encode(*leaf) << "\n";
    return EXIT_VERIFIED;
}

int run_inclusion(const Merkle::Hasher& hasher, const Flags& flags, std::ostream& out, std::ostream& err)
{
    if (!only_known(flags, { "index", "size", "leaf-hash", "body", "root", "hash" }, err))
        return EXIT_BAD_INPUT;

    auto index = single(flags, "index").and_then(parse_u64);
    auto size = single(flags, "size").and_then(parse_u64);
    auto root = single(flags, "root");
    auto leaf_hash = single(flags, "leaf-hash");
    auto body = single(flags, "body");

    if (!index || !size || !root || leaf_hash.has_value() == body.has_value()) {
        err << "Error: inclusion requires --index, --size, --root and one of --leaf-hash or --body\n";
        return EXIT_BAD_INPUT;
    }

    Merkle::InclusionBundle bundle {
        .log_index = *index,
        .tree_size = *size,
        .leaf_hash = {},
        .hashes = all(flags, "hash"),
        .root_hash = *root,
    };

    if (body) {
        auto leaf = Merkle::compute_leaf_hash(hasher, *body);
        if (!leaf) {
            err << "Error: " << leaf.error().message() << "\n";
            return EXIT_BAD_INPUT;
        }
        bundle.leaf_hash = Merkle::hex_encode(*leaf);
    } else {
        bundle.leaf_hash = *leaf_hash;
    }

    spdlog::debug("inclusion: index {} size {} leaf {} with {} hashes", bundle.log_index, bundle.tree_size, bundle.leaf_hash, bundle.hashes.size());
    return report(Merkle::verify_inclusion(hasher, bundle), "Inclusion verified", out, err);
}

int run_consistency(const Merkle::Hasher& hasher, const Flags& flags, std::ostream& out, std::ostream& err)
{
    if (!only_known(flags, { "size1", "size2", "root1", "root2", "hash" }, err))
        return EXIT_BAD_INPUT;

    auto size1 = single(flags, "size1").and_then(parse_u64);
    auto size2 = single(flags, "size2").and_then(parse_u64);
    auto root1 = single(flags, "root1");
    auto root2 = single(flags, "root2");

    if (!size1 || !size2 || !root1 || !root2) {
        err << "Error: consistency requires --size1, --size2, --root1 and --root2\n";
        return EXIT_BAD_INPUT;
    }

    Merkle::ConsistencyBundle bundle {
        .first_size = *size1,
        .last_size = *size2,
        .hashes = all(flags, "hash"),
        .first_root = *root1,
        .last_root = *root2,
    };

    spdlog::debug("consistency: {} -> {} with {} hashes", bundle.first_size, bundle.last_size, bundle.hashes.size());
    return report(Merkle::verify_consistency(hasher, bundle), "Consistency verified", out, err);
}

} // namespace

void print_usage(std::ostream& err)
{
    err << "Usage: rektor [--config FILE] [--debug] <command> [flags]\n"
       "\n"
       "Commands:\n"
       "  leaf-hash --body B64\n"
       "      Print the leaf hash of a base64 encoded log entry body\n"
       "  inclusion --index N --size N (--leaf-hash HEX | --body B64) --root HEX [--hash HEX]...\n"
       "      Verify that a leaf is included in the tree of the given size\n"
       "  consistency --size1 N --size2 N --root1 HEX --root2 HEX [--hash HEX]...\n"
       "      Verify that the second tree is an append-only extension of the first\n"
       "\n"
       "Exit status: 0 verified, 1 verification failed, 2 malformed input\n";
}

int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
{
    auto opts = parse_args(argc, argv, err);
    if (!opts) {
        print_usage(err);
        return EXIT_BAD_INPUT;
    }

    auto logger = Audit::Logging::create("rektor");
    spdlog::set_default_logger(logger);

    Audit::Config config;
    if (opts->config) {
        auto loaded = Audit::load_config(*opts->config);
        if (!loaded) {
            err << "Error: " << opts->config->string() << ": " << loaded.error().message() << "\n";
            return EXIT_BAD_INPUT;
        }
        config = std::move(*loaded);
    }

    if (auto res = Audit::Logging::set_level(opts->debug ? "debug" : config.log_level); !res) {
        err << "Error: log level '" << config.log_level << "': " << res.error().message() << "\n";
        return EXIT_BAD_INPUT;
    }

    auto hasher = Merkle::make_hasher(config.hash_algorithm);
    if (!hasher) {
        err << "Error: hash algorithm '" << config.hash_algorithm << "': " << hasher.error().message() << "\n";
        return EXIT_BAD_INPUT;
    }
    logger->debug("using {} ({} byte digests)", hasher->name(), hasher->size());

    if (opts->command == "leaf-hash")
        return run_leaf_hash(*hasher, opts->flags, out, err);
    if (opts->command == "inclusion")
        return run_inclusion(*hasher, opts->flags, out, err);
    if (opts->command == "consistency")
        return run_consistency(*hasher, opts->flags, out, err);

    err << "Error: unknown command " << opts->command << "\n";
    print_usage(err);
    return EXIT_BAD_INPUT;
}

} // namespace Rektor::Cli
