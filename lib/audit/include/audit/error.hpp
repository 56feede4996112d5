#pragma once

#include <cstdint>
#include <system_error>

namespace Rektor::Audit {

enum class AuditError : std::uint8_t {
    Success = 0,
    ArtifactNotFound, // artifact 路径不存在
    ArtifactUnreadable,
    InvalidPublicKey, // 既不是 PEM 证书也不是 PEM 公钥
    InvalidSignature, // artifact 签名验证失败
    EmptyCheckpoint, // 没有可比较的旧 checkpoint
    InvalidConfig,
    InvalidLogLevel,
    OpenSSLError,
};

} // namespace Rektor::Audit

namespace std {
template <>
struct is_error_code_enum<Rektor::Audit::AuditError> : true_type { };
} // namespace std

namespace Rektor::Audit {

[[nodiscard]] const std::error_category& audit_category() noexcept;

inline std::error_code make_error_code(AuditError e)
{
    return { static_cast<int>(e), audit_category() };
}

} // namespace Rektor::Audit
