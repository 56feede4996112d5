#include "audit/config.hpp"
#include "audit/error.hpp"

#include <fstream>
#include <string_view>

namespace Rektor::Audit {
namespace {

    std::string_view trim(std::string_view s)
    {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto begin = s.find_first_not_of(whitespace);
        if (begin == std::string_view::npos)
            return {};
        const auto end = s.find_last_not_of(whitespace);
        return s.substr(begin, end - begin + 1);
    }

} // namespace

auto parse_config(std::istream& in) -> std::expected<Config, std::error_code>
{
    Config config;
    std::string section;
    std::string raw;

    while (std::getline(in, raw)) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';')
            continue;

        if (line.front() == '[') {
            if (line.back() != ']')
                return std::unexpected(make_error_code(AuditError::InvalidConfig));
            section = std::string(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            return std::unexpected(make_error_code(AuditError::InvalidConfig));

        const auto key = trim(line.substr(0, eq));
        const auto value = trim(line.substr(eq + 1));
        if (key.empty())
            return std::unexpected(make_error_code(AuditError::InvalidConfig));

        // 其它段 (比如日志服务器地址) 由各自的组件读取
        if (section != "verifier")
            continue;

        if (key == "hash_algorithm") {
            config.hash_algorithm = value;
        } else if (key == "log_level") {
            config.log_level = value;
        }
    }

    if (in.bad())
        return std::unexpected(make_error_code(AuditError::InvalidConfig));
    return config;
}

auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::error_code>
{
    std::ifstream file(path);
    if (!file)
        return std::unexpected(make_error_code(AuditError::InvalidConfig));
    return parse_config(file);
}

} // namespace Rektor::Audit
