#include "audit/logging.hpp"
#include "audit/error.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace Rektor::Audit::Logging {

std::shared_ptr<spdlog::logger> create(const std::string& name)
{
    // spdlog 的 registry 对重复注册会抛异常，查找和创建必须在同一把锁里
    static std::mutex mutex;
    std::scoped_lock lock(mutex);

    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return spdlog::stderr_color_mt(name);
}

auto set_level(std::string_view level) -> std::expected<void, std::error_code>
{
    const std::string name(level);
    const auto parsed = spdlog::level::from_str(name);
    // from_str 对未知名称返回 off
    if (parsed == spdlog::level::off && name != "off") {
        return std::unexpected(make_error_code(AuditError::InvalidLogLevel));
    }
    spdlog::set_level(parsed);
    return {};
}

} // namespace Rektor::Audit::Logging
