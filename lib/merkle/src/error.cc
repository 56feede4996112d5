#include "merkle/error.hpp"

#include <string>

namespace Rektor::Merkle {
namespace {

    class MerkleErrorCategory : public std::error_category {
    public:
        [[nodiscard]] const char* name() const noexcept override { return "rektor.merkle"; }

        std::string message(int ev) const override
        {
            switch (static_cast<Error>(ev)) {
            case Error::Success:
                return "Success";
            case Error::IndexBeyondSize:
                return "Leaf index is beyond tree size";
            case Error::LeafHashSize:
                return "Leaf hash has unexpected size";
            case Error::ProofHashSize:
                return "Proof hash has unexpected size";
            case Error::RootHashSize:
                return "Root hash has unexpected size";
            case Error::WrongProofSize:
                return "Wrong proof size for tree shape";
            case Error::SizesOutOfOrder:
                return "Second tree size is smaller than the first";
            case Error::UnexpectedProof:
                return "Expected empty proof";
            case Error::EmptyProof:
                return "Empty proof";
            case Error::UnknownHashAlgorithm:
                return "Unknown hash algorithm";
            case Error::RootMismatch:
                return "Calculated root does not match expected root";
            case Error::InvalidHex:
                return "Invalid hex string";
            case Error::InvalidBase64:
                return "Invalid base64 string";
            default:
                return "Unknown merkle error";
            }
        }

        // 每个错误码都归入一个 ErrorKind，这样 ec == ErrorKind::Decoding 之类的比较可以直接成立
        [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override
        {
            switch (static_cast<Error>(ev)) {
            case Error::RootMismatch:
                return make_error_condition(ErrorKind::RootMismatch);
            case Error::InvalidHex:
            case Error::InvalidBase64:
                return make_error_condition(ErrorKind::Decoding);
            case Error::Success:
                return { 0, *this };
            default:
                return make_error_condition(ErrorKind::InputShape);
            }
        }
    };

    class ErrorKindCategory : public std::error_category {
    public:
        [[nodiscard]] const char* name() const noexcept override { return "rektor.merkle.kind"; }

        std::string message(int ev) const override
        {
            switch (static_cast<ErrorKind>(ev)) {
            case ErrorKind::InputShape:
                return "Malformed verification request";
            case ErrorKind::RootMismatch:
                return "Proof failed cryptographic verification";
            case ErrorKind::Decoding:
                return "Malformed encoded input";
            default:
                return "Unknown error kind";
            }
        }
    };

} // namespace

const std::error_category& merkle_category() noexcept
{
    static MerkleErrorCategory instance;
    return instance;
}

const std::error_category& error_kind_category() noexcept
{
    static ErrorKindCategory instance;
    return instance;
}

std::string VerifyError::message() const
{
    if (code == Error::RootMismatch) {
        return "calculated root " + calculated_root + " does not match expected root " + expected_root;
    }
    return code.message();
}

} // namespace Rektor::Merkle
