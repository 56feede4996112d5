#pragma once

#include <cstdint>
#include <string>

#include "merkle/bundle.hpp"

namespace Rektor::Audit {

// 日志在某个时刻的状态，root_hash 为 hex
struct Checkpoint {
    std::string tree_id;
    uint64_t tree_size = 0;
    std::string root_hash;

    [[nodiscard]] bool empty() const { return tree_size == 0 && root_hash.empty(); }
};

struct LogEntry {
    uint64_t log_index = 0;
    std::string body; // base64，叶子哈希的输入
    std::string signature; // base64 DER 签名
    std::string public_key; // base64 PEM，证书或公钥
    Merkle::InclusionBundle inclusion; // leaf_hash 字段由调用方在本地填写
};

} // namespace Rektor::Audit
