#include "merkle/proof.hpp"
#include "merkle/codec.hpp"

#include <algorithm>

namespace Rektor::Merkle::detail {

VerifyResult verify_match(BytesSpan calculated, BytesSpan expected)
{
    if (!std::ranges::equal(calculated, expected)) {
        return std::unexpected(VerifyError(
            make_error_code(Error::RootMismatch),
            hex_encode(expected),
            hex_encode(calculated)));
    }
    return {};
}

} // namespace Rektor::Merkle::detail
