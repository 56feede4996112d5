#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <system_error>

#include <openssl/evp.h>

#include "merkle/common.hpp"

namespace Rektor::Audit {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

// 跨翻译单元传递，用具名 deleter
using PublicKey = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

// PEM 编码的 X.509 证书或 SubjectPublicKeyInfo
[[nodiscard]] auto load_public_key(Merkle::BytesSpan pem) -> std::expected<PublicKey, std::error_code>;

// signature 为 DER 编码，摘要固定为 SHA-256
[[nodiscard]] auto verify_artifact_signature(const PublicKey& key, Merkle::BytesSpan signature, Merkle::BytesSpan artifact)
    -> std::expected<void, std::error_code>;

[[nodiscard]] auto read_artifact(const std::filesystem::path& path) -> std::expected<Merkle::Bytes, std::error_code>;

} // namespace Rektor::Audit
