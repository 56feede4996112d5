#pragma once

#include <expected>
#include <string_view>
#include <system_error>

#include "merkle/common.hpp"
#include "merkle/hasher.hpp"

namespace Rektor::Merkle {

// 叶子哈希必须在本地根据条目内容计算，不能使用服务器给出的 leaf hash
[[nodiscard]] Digest compute_leaf_hash(const Hasher& hasher, BytesSpan entry);

// body: 日志条目的 base64 编码内容 (Rekor 的 entry["body"])
[[nodiscard]] auto compute_leaf_hash(const Hasher& hasher, std::string_view body)
    -> std::expected<Digest, std::error_code>;

} // namespace Rektor::Merkle
