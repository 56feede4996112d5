#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <utility>

namespace Rektor::Merkle {

enum class Error : std::uint8_t {
    Success = 0,
    IndexBeyondSize, // index >= size
    LeafHashSize, // leaf hash 长度不等于 digest size
    ProofHashSize, // proof 中某个元素长度不对
    RootHashSize, // root 长度不对
    WrongProofSize, // proof 元素个数与树形不符
    SizesOutOfOrder, // size2 < size1
    UnexpectedProof, // 本应为空的 proof 非空
    EmptyProof, // 需要 proof 却为空
    UnknownHashAlgorithm, // OpenSSL 不认识的摘要名
    RootMismatch, // 重新计算的 root 与声明的 root 不一致
    InvalidHex,
    InvalidBase64,
};

// 三类互不相交的失败，调用方按类别决定是否致命
enum class ErrorKind : std::uint8_t {
    InputShape = 1,
    RootMismatch,
    Decoding,
};

} // namespace Rektor::Merkle

// 必须在 VerifyError::is 之前特化，否则 ErrorKind 无法转换为 error_condition
namespace std {
template <>
struct is_error_code_enum<Rektor::Merkle::Error> : true_type { };

template <>
struct is_error_condition_enum<Rektor::Merkle::ErrorKind> : true_type { };
} // namespace std

namespace Rektor::Merkle {

[[nodiscard]] const std::error_category& merkle_category() noexcept;
[[nodiscard]] const std::error_category& error_kind_category() noexcept;

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), merkle_category() };
}

inline std::error_condition make_error_condition(ErrorKind k)
{
    return { static_cast<int>(k), error_kind_category() };
}

/// Failure of a verification call.
///
/// For a root mismatch both roots are kept as lowercase hex so the caller
/// can report exactly what diverged; for every other code they are empty.
struct VerifyError {
    std::error_code code;
    std::string expected_root;
    std::string calculated_root;

    VerifyError(std::error_code ec)
        : code(ec)
    {
    }

    VerifyError(std::error_code ec, std::string expected, std::string calculated)
        : code(ec)
        , expected_root(std::move(expected))
        , calculated_root(std::move(calculated))
    {
    }

    [[nodiscard]] bool is(ErrorKind kind) const { return code == kind; }

    [[nodiscard]] std::string message() const;
};

using VerifyResult = std::expected<void, VerifyError>;

} // namespace Rektor::Merkle
