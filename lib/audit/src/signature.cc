#include "audit/signature.hpp"
#include "audit/error.hpp"
#include "openssl.hpp"

#include <fstream>
#include <iterator>

#include <openssl/err.h>
#include <openssl/pem.h>

namespace Rektor::Audit {
namespace {

    impl::BioPtr make_bio(Merkle::BytesSpan pem)
    {
        return impl::BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    }

} // namespace

auto load_public_key(Merkle::BytesSpan pem) -> std::expected<PublicKey, std::error_code>
{
    if (pem.empty())
        return std::unexpected(make_error_code(AuditError::InvalidPublicKey));

    auto bio = make_bio(pem);
    if (!bio)
        return std::unexpected(make_error_code(AuditError::OpenSSLError));

    // hashedrekord 条目里放的是签名证书
    impl::X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (cert) {
        PublicKey key(X509_get_pubkey(cert.get()));
        if (!key)
            return std::unexpected(make_error_code(AuditError::InvalidPublicKey));
        return key;
    }
    ERR_clear_error();

    bio = make_bio(pem);
    if (!bio)
        return std::unexpected(make_error_code(AuditError::OpenSSLError));

    PublicKey key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        ERR_clear_error();
        return std::unexpected(make_error_code(AuditError::InvalidPublicKey));
    }
    return key;
}

auto verify_artifact_signature(const PublicKey& key, Merkle::BytesSpan signature, Merkle::BytesSpan artifact)
    -> std::expected<void, std::error_code>
{
    if (!key)
        return std::unexpected(make_error_code(AuditError::InvalidPublicKey));

    impl::EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx)
        return std::unexpected(make_error_code(AuditError::OpenSSLError));

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        ERR_clear_error();
        return std::unexpected(make_error_code(AuditError::InvalidPublicKey));
    }

    // 1 = 通过，0 = 签名不匹配，负数 = DER 解析失败等
    const int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), artifact.data(), artifact.size());
    if (rc != 1) {
        ERR_clear_error();
        return std::unexpected(make_error_code(AuditError::InvalidSignature));
    }
    return {};
}

auto read_artifact(const std::filesystem::path& path) -> std::expected<Merkle::Bytes, std::error_code>
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return std::unexpected(make_error_code(AuditError::ArtifactNotFound));

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return std::unexpected(make_error_code(AuditError::ArtifactUnreadable));

    Merkle::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
        return std::unexpected(make_error_code(AuditError::ArtifactUnreadable));
    return data;
}

} // namespace Rektor::Audit
