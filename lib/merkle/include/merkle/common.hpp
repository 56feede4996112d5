#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Rektor::Merkle {
using Byte = uint8_t;
using Bytes = std::vector<Byte>;
using BytesSpan = std::span<const Byte>;

// 摘要长度由 Hasher 决定 (SHA-256 为 32 字节)，所以这里不用 std::array
using Digest = std::vector<Byte>;

// 顺序有意义: 第 i 个元素对应树形推导中的第 i 步
using Proof = std::vector<Digest>;

inline BytesSpan as_span(const std::string& s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

} // namespace Rektor::Merkle
