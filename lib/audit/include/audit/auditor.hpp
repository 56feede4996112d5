#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "audit/error.hpp"
#include "audit/logging.hpp"
#include "audit/signature.hpp"
#include "audit/source.hpp"
#include "audit/types.hpp"
#include "merkle/bundle.hpp"
#include "merkle/codec.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/leaf.hpp"

namespace Rektor::Audit {

/// Audits a transparency log through a LogSource.
///
/// Every hash the log hands out is recomputed locally: the leaf hash comes
/// from the entry body, never from the server, and roots are only trusted
/// after a proof links them to something already verified.
template <LogSource Source>
class Auditor {
public:
    explicit Auditor(Source& source, Merkle::Hasher hasher = Merkle::default_hasher())
        : source_(source)
        , hasher_(hasher)
        , logger_(Logging::create("rektor:audit"))
    {
    }

    // artifact 签名 + 条目包含证明
    [[nodiscard]] Merkle::VerifyResult verify_inclusion(uint64_t log_index, const std::filesystem::path& artifact_path)
    {
        auto artifact = read_artifact(artifact_path);
        if (!artifact)
            return fail("read artifact " + artifact_path.string(), artifact.error());

        auto entry = source_.get_log_entry(log_index);
        if (!entry)
            return fail("fetch log entry " + std::to_string(log_index), entry.error());

        if (auto res = verify_entry_signature(*entry, *artifact); !res)
            return res;

        auto leaf = Merkle::compute_leaf_hash(hasher_, entry->body);
        if (!leaf)
            return fail("decode entry body", leaf.error());

        auto bundle = entry->inclusion;
        bundle.leaf_hash = Merkle::hex_encode(*leaf);
        logger_->debug("Log index {}: leaf hash {}, proof index {} in tree of size {} with {} hashes",
            log_index,
            bundle.leaf_hash,
            bundle.log_index,
            bundle.tree_size,
            bundle.hashes.size());

        auto res = Merkle::verify_inclusion(hasher_, bundle);
        if (!res) {
            report("Inclusion", res.error());
            return res;
        }

        logger_->info("Inclusion of log index {} verified against root {}", log_index, bundle.root_hash);
        return {};
    }

    // 成功时返回最新的 checkpoint，调用方用它替换 previous
    [[nodiscard]] auto verify_consistency(const Checkpoint& previous) -> std::expected<Checkpoint, Merkle::VerifyError>
    {
        if (previous.empty())
            return fail("check previous checkpoint", make_error_code(AuditError::EmptyCheckpoint));

        auto latest = source_.get_latest_checkpoint();
        if (!latest)
            return fail("fetch latest checkpoint", latest.error());

        if (!previous.tree_id.empty() && previous.tree_id != latest->tree_id) {
            logger_->warn("Tree id changed from {} to {}", previous.tree_id, latest->tree_id);
        }

        Merkle::ConsistencyBundle bundle {
            .first_size = previous.tree_size,
            .last_size = latest->tree_size,
            .hashes = {},
            .first_root = previous.root_hash,
            .last_root = latest->root_hash,
        };

        // 大小相同或倒退时不需要向日志要证明，直接交给引擎判断
        if (previous.tree_size < latest->tree_size) {
            auto hashes = source_.get_consistency_proof(previous.tree_size, latest->tree_size);
            if (!hashes)
                return fail("fetch consistency proof", hashes.error());
            bundle.hashes = std::move(*hashes);
        }

        logger_->debug("Consistency {} -> {} with {} hashes", bundle.first_size, bundle.last_size, bundle.hashes.size());

        auto res = Merkle::verify_consistency(hasher_, bundle);
        if (!res) {
            report("Consistency", res.error());
            return std::unexpected(std::move(res.error()));
        }

        logger_->info("Consistency verified: tree size {} -> {}, root {}", bundle.first_size, bundle.last_size, bundle.last_root);
        return std::move(*latest);
    }

    [[nodiscard]] auto latest_checkpoint() -> std::expected<Checkpoint, std::error_code>
    {
        return source_.get_latest_checkpoint();
    }

private:
    Merkle::VerifyResult verify_entry_signature(const LogEntry& entry, Merkle::BytesSpan artifact)
    {
        auto pem = Merkle::base64_decode(entry.public_key);
        if (!pem)
            return fail("decode public key", pem.error());

        auto signature = Merkle::base64_decode(entry.signature);
        if (!signature)
            return fail("decode signature", signature.error());

        auto key = load_public_key(*pem);
        if (!key)
            return fail("load public key", key.error());

        if (auto res = verify_artifact_signature(*key, *signature, artifact); !res)
            return fail("verify artifact signature", res.error());

        logger_->debug("Artifact signature verified for log index {}", entry.log_index);
        return {};
    }

    std::unexpected<Merkle::VerifyError> fail(std::string_view step, std::error_code ec)
    {
        logger_->error("Failed to {}: {}", step, ec.message());
        return std::unexpected(Merkle::VerifyError(ec));
    }

    void report(std::string_view what, const Merkle::VerifyError& err)
    {
        if (err.is(Merkle::ErrorKind::RootMismatch)) {
            logger_->warn("{} proof rejected: expected root {}, calculated root {}", what, err.expected_root, err.calculated_root);
        } else {
            logger_->error("{} proof malformed: {}", what, err.message());
        }
    }

    Source& source_;
    Merkle::Hasher hasher_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace Rektor::Audit
