#include "merkle/hasher.hpp"
#include "merkle/evp.hpp"
#include "merkle/error.hpp"

#include <initializer_list>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace Rektor::Merkle {
using impl::EvpMdCtxPtr;

Hasher::Hasher(const evp_md_st* md)
    : md_(md)
    , size_(static_cast<size_t>(EVP_MD_get_size(md)))
{
}

Digest Hasher::digest(std::initializer_list<BytesSpan> parts) const
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (1 != EVP_DigestInit_ex(ctx.get(), md_, nullptr)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    for (const auto& part : parts) {
        if (1 != EVP_DigestUpdate(ctx.get(), part.data(), part.size())) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    Digest out(size_);
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len)) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(len);
    return out;
}

Digest Hasher::hash_leaf(BytesSpan leaf) const
{
    return digest({ BytesSpan(&LEAF_HASH_PREFIX, 1), leaf });
}

Digest Hasher::hash_children(BytesSpan left, BytesSpan right) const
{
    return digest({ BytesSpan(&NODE_HASH_PREFIX, 1), left, right });
}

Digest Hasher::empty_root() const
{
    return digest({});
}

std::string Hasher::name() const
{
    return EVP_MD_get0_name(md_);
}

const Hasher& default_hasher()
{
    static const Hasher instance(EVP_sha256());
    return instance;
}

auto make_hasher(std::string_view name) -> std::expected<Hasher, std::error_code>
{
    // EVP_get_digestbyname 需要以 NUL 结尾的字符串
    const std::string owned(name);
    const EVP_MD* md = EVP_get_digestbyname(owned.c_str());
    if (md == nullptr) {
        return std::unexpected(make_error_code(Error::UnknownHashAlgorithm));
    }
    // XOF (shake128/256) 没有固定输出长度，不能作为树哈希
    if (EVP_MD_get_size(md) <= 0 || (EVP_MD_get_flags(md) & EVP_MD_FLAG_XOF) != 0) {
        return std::unexpected(make_error_code(Error::UnknownHashAlgorithm));
    }
    return Hasher(md);
}

} // namespace Rektor::Merkle
