#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "merkle/error.hpp"
#include "merkle/hasher.hpp"

namespace Rektor::Merkle {

// 日志服务器返回的包含证明，哈希均为 hex 字符串
struct InclusionBundle {
    uint64_t log_index = 0;
    uint64_t tree_size = 0;
    std::string leaf_hash; // 本地计算，见 compute_leaf_hash
    std::vector<std::string> hashes;
    std::string root_hash;
};

struct ConsistencyBundle {
    uint64_t first_size = 0;
    uint64_t last_size = 0;
    std::vector<std::string> hashes;
    std::string first_root;
    std::string last_root;
};

// 先解码全部 hex 字段，任何解码错误都在形状检查和哈希之前返回 (ErrorKind::Decoding)
[[nodiscard]] VerifyResult verify_inclusion(const Hasher& hasher, const InclusionBundle& bundle);

[[nodiscard]] VerifyResult verify_consistency(const Hasher& hasher, const ConsistencyBundle& bundle);

} // namespace Rektor::Merkle
