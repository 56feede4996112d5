#pragma once

#include <expected>
#include <filesystem>
#include <istream>
#include <string>
#include <system_error>

namespace Rektor::Audit {

struct Config {
    std::string hash_algorithm = "sha256";
    std::string log_level = "info";
};

// INI 格式，只读取 [verifier] 段，未知 key 忽略
[[nodiscard]] auto parse_config(std::istream& in) -> std::expected<Config, std::error_code>;

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::error_code>;

} // namespace Rektor::Audit
