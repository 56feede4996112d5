#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

#include "audit/types.hpp"

namespace Rektor::Audit {

/// Read-only view of a transparency log.
///
/// Implementations own their transport and receive its settings (base URL,
/// timeouts) in their constructor. Failures are reported as error codes of
/// the implementation's own category and are passed through unchanged.
template <typename S>
concept LogSource = requires(S& source, uint64_t index, uint64_t first, uint64_t last) {
    { source.get_log_entry(index) } -> std::same_as<std::expected<LogEntry, std::error_code>>;
    { source.get_latest_checkpoint() } -> std::same_as<std::expected<Checkpoint, std::error_code>>;
    // 返回 hex 编码的一致性证明
    { source.get_consistency_proof(first, last) } -> std::same_as<std::expected<std::vector<std::string>, std::error_code>>;
};

} // namespace Rektor::Audit
