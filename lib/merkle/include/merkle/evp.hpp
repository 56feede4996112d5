#pragma once

#include <memory>
#include <openssl/evp.h>

namespace Rektor::Merkle::impl {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
    decltype([](EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    })>;

} // namespace Rektor::Merkle::impl
