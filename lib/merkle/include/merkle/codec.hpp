#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "merkle/common.hpp"

namespace Rektor::Merkle {

// 小写 hex
[[nodiscard]] std::string hex_encode(BytesSpan data);

// 大小写都接受；奇数长度或非 hex 字符返回 Error::InvalidHex
[[nodiscard]] auto hex_decode(std::string_view hex) -> std::expected<Bytes, std::error_code>;

[[nodiscard]] std::string base64_encode(BytesSpan data);

// 标准 base64 (带 '=' 填充)；非法返回 Error::InvalidBase64
[[nodiscard]] auto base64_decode(std::string_view b64) -> std::expected<Bytes, std::error_code>;

} // namespace Rektor::Merkle
