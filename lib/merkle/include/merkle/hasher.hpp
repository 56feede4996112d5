#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>

#include "merkle/common.hpp"

struct evp_md_st;

namespace Rektor::Merkle {

// RFC 6962 域分离前缀
inline constexpr Byte LEAF_HASH_PREFIX { 0x00 };
inline constexpr Byte NODE_HASH_PREFIX { 0x01 };

// 证明引擎只依赖这四个操作，任何满足该 concept 的类型都可以替换默认实现
template <typename H>
concept LogHasher = requires(const H& hasher, BytesSpan data, const Digest& digest) {
    { hasher.hash_leaf(data) } -> std::same_as<Digest>;
    { hasher.hash_children(digest, digest) } -> std::same_as<Digest>;
    { hasher.empty_root() } -> std::same_as<Digest>;
    { hasher.size() } -> std::convertible_to<size_t>;
};

class Hasher;

// SHA-256，Rekor 使用的算法
[[nodiscard]] const Hasher& default_hasher();

// 按 OpenSSL 名称 ("sha256", "sha384", "sha3-256" ...) 构造，拒绝 XOF 和未知名称
[[nodiscard]] auto make_hasher(std::string_view name) -> std::expected<Hasher, std::error_code>;

/// RFC 6962 tree hasher over an OpenSSL message digest.
///
/// Holds only the digest descriptor, so a single instance can be shared
/// between threads; every hash call uses its own EVP context.
class Hasher {
public:
    // Hash(0x00 || leaf)
    [[nodiscard]] Digest hash_leaf(BytesSpan leaf) const;

    // Hash(0x01 || left || right)，左右顺序不可交换
    [[nodiscard]] Digest hash_children(BytesSpan left, BytesSpan right) const;

    // 空树的 root: Hash("")
    [[nodiscard]] Digest empty_root() const;

    [[nodiscard]] size_t size() const { return size_; }

    [[nodiscard]] std::string name() const;

private:
    // 只能经由上面两个工厂构造，md 的长度已经检查过
    explicit Hasher(const evp_md_st* md);

    friend const Hasher& default_hasher();
    friend auto make_hasher(std::string_view name) -> std::expected<Hasher, std::error_code>;

    [[nodiscard]] Digest digest(std::initializer_list<BytesSpan> parts) const;

    const evp_md_st* md_;
    size_t size_;
};

static_assert(LogHasher<Hasher>);

} // namespace Rektor::Merkle
