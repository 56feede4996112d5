#include "audit/error.hpp"

#include <string>

namespace Rektor::Audit {
namespace {

    class AuditErrorCategory : public std::error_category {
    public:
        [[nodiscard]] const char* name() const noexcept override { return "rektor.audit"; }

        std::string message(int ev) const override
        {
            switch (static_cast<AuditError>(ev)) {
            case AuditError::Success:
                return "Success";
            case AuditError::ArtifactNotFound:
                return "Artifact file does not exist";
            case AuditError::ArtifactUnreadable:
                return "Artifact file could not be read";
            case AuditError::InvalidPublicKey:
                return "Public key or certificate could not be parsed";
            case AuditError::InvalidSignature:
                return "Signature is invalid";
            case AuditError::EmptyCheckpoint:
                return "Previous checkpoint is empty";
            case AuditError::InvalidConfig:
                return "Malformed configuration file";
            case AuditError::InvalidLogLevel:
                return "Unknown log level";
            case AuditError::OpenSSLError:
                return "OpenSSL failure";
            default:
                return "Unknown audit error";
            }
        }
    };

} // namespace

const std::error_category& audit_category() noexcept
{
    static AuditErrorCategory instance;
    return instance;
}

} // namespace Rektor::Audit
