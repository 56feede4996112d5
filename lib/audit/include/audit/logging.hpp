#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include <spdlog/logger.h>

namespace Rektor::Audit::Logging {

// 同名 logger 只创建一次，输出到 stderr
[[nodiscard]] std::shared_ptr<spdlog::logger> create(const std::string& name);

// "trace" "debug" "info" "warn" "error" "critical" "off"
[[nodiscard]] auto set_level(std::string_view level) -> std::expected<void, std::error_code>;

} // namespace Rektor::Audit::Logging
