#include "merkle/leaf.hpp"
#include "merkle/codec.hpp"

namespace Rektor::Merkle {

Digest compute_leaf_hash(const Hasher& hasher, BytesSpan entry)
{
    return hasher.hash_leaf(entry);
}

auto compute_leaf_hash(const Hasher& hasher, std::string_view body)
    -> std::expected<Digest, std::error_code>
{
    auto entry = base64_decode(body);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return hasher.hash_leaf(*entry);
}

} // namespace Rektor::Merkle
