#include "merkle/bundle.hpp"
#include "merkle/codec.hpp"
#include "merkle/proof.hpp"

#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace Rektor::Merkle {
namespace {

    auto decode_proof(const std::vector<std::string>& hashes) -> std::expected<Proof, std::error_code>
    {
        Proof proof;
        proof.reserve(hashes.size());
        for (const auto& h : hashes) {
            auto bytes = hex_decode(h);
            if (!bytes) {
                return std::unexpected(bytes.error());
            }
            proof.push_back(std::move(*bytes));
        }
        return proof;
    }

} // namespace

VerifyResult verify_inclusion(const Hasher& hasher, const InclusionBundle& bundle)
{
    auto leaf = hex_decode(bundle.leaf_hash);
    if (!leaf) {
        return std::unexpected(VerifyError(leaf.error()));
    }
    auto root = hex_decode(bundle.root_hash);
    if (!root) {
        return std::unexpected(VerifyError(root.error()));
    }
    auto proof = decode_proof(bundle.hashes);
    if (!proof) {
        return std::unexpected(VerifyError(proof.error()));
    }

    return verify_inclusion(hasher, bundle.log_index, bundle.tree_size, *leaf, *proof, *root);
}

VerifyResult verify_consistency(const Hasher& hasher, const ConsistencyBundle& bundle)
{
    auto root1 = hex_decode(bundle.first_root);
    if (!root1) {
        return std::unexpected(VerifyError(root1.error()));
    }
    auto root2 = hex_decode(bundle.last_root);
    if (!root2) {
        return std::unexpected(VerifyError(root2.error()));
    }
    auto proof = decode_proof(bundle.hashes);
    if (!proof) {
        return std::unexpected(VerifyError(proof.error()));
    }

    return verify_consistency(hasher, bundle.first_size, bundle.last_size, *proof, *root1, *root2);
}

} // namespace Rektor::Merkle
