#pragma once

#include <memory>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include "merkle/evp.hpp"

namespace Rektor::Audit::impl {

using BioPtr = std::unique_ptr<BIO, decltype([](BIO* bio) { BIO_free(bio); })>;
using X509Ptr = std::unique_ptr<X509, decltype([](X509* cert) { X509_free(cert); })>;
using Merkle::impl::EvpMdCtxPtr;

} // namespace Rektor::Audit::impl
