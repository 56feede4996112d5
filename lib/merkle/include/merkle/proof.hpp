#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>

#include "merkle/common.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"

namespace Rektor::Merkle {

// inner: 叶子到 "index 与 size-1 的最高分歧位" 之间需要解决的层数
// border: 其上右侧参差边界需要的额外哈希数
struct ProofShape {
    size_t inner;
    size_t border;

    [[nodiscard]] constexpr size_t total() const { return inner + border; }
};

[[nodiscard]] constexpr ProofShape decompose_inclusion_proof(uint64_t index, uint64_t size)
{
    const auto inner = static_cast<size_t>(std::bit_width(index ^ (size - 1)));
    const auto border = static_cast<size_t>(std::popcount(inner >= 64 ? uint64_t { 0 } : index >> inner));
    return { inner, border };
}

namespace detail {

    [[nodiscard]] inline std::unexpected<VerifyError> fail(Error e)
    {
        return std::unexpected(VerifyError(make_error_code(e)));
    }

    [[nodiscard]] inline bool all_sized(std::span<const Digest> proof, size_t size)
    {
        return std::ranges::all_of(proof, [size](const Digest& h) { return h.size() == size; });
    }

    // 逐字节比较；不一致时带上两个 root 的 hex
    [[nodiscard]] VerifyResult verify_match(BytesSpan calculated, BytesSpan expected);

    // 所有形状检查都在哈希之前完成
    template <LogHasher H>
    [[nodiscard]] VerifyResult check_inclusion_inputs(const H& hasher,
        uint64_t index,
        uint64_t size,
        BytesSpan leaf_hash,
        std::span<const Digest> proof)
    {
        if (index >= size) {
            return fail(Error::IndexBeyondSize);
        }
        if (leaf_hash.size() != hasher.size()) {
            return fail(Error::LeafHashSize);
        }
        if (!all_sized(proof, hasher.size())) {
            return fail(Error::ProofHashSize);
        }
        if (proof.size() != decompose_inclusion_proof(index, size).total()) {
            return fail(Error::WrongProofSize);
        }
        return {};
    }

    // index 的第 i 位为 0: 当前子树是左孩子 -> H(seed || h)；为 1: 右孩子 -> H(h || seed)
    template <LogHasher H>
    Digest chain_inner(const H& hasher, Digest seed, std::span<const Digest> proof, uint64_t index)
    {
        for (size_t i = 0; i < proof.size(); ++i) {
            if (((index >> i) & 1) == 0) {
                seed = hasher.hash_children(seed, proof[i]);
            } else {
                seed = hasher.hash_children(proof[i], seed);
            }
        }
        return seed;
    }

    // 只处理 index 第 i 位为 1 的步骤，其余跳过
    template <LogHasher H>
    Digest chain_inner_right(const H& hasher, Digest seed, std::span<const Digest> proof, uint64_t index)
    {
        for (size_t i = 0; i < proof.size(); ++i) {
            if (((index >> i) & 1) == 1) {
                seed = hasher.hash_children(proof[i], seed);
            }
        }
        return seed;
    }

    // 边界上的每个哈希都是左兄弟
    template <LogHasher H>
    Digest chain_border_right(const H& hasher, Digest seed, std::span<const Digest> proof)
    {
        for (const auto& h : proof) {
            seed = hasher.hash_children(h, seed);
        }
        return seed;
    }

} // namespace detail

/// Recomputes the tree root from an inclusion proof (RFC 6962 section 2.1.1).
///
/// Fails with an input-shape error, before any hashing, when index >= size,
/// when the leaf hash or a proof hash is not hasher.size() bytes long, or
/// when the proof length does not match the shape derived from (index, size).
template <LogHasher H>
[[nodiscard]] auto root_from_inclusion_proof(const H& hasher,
    uint64_t index,
    uint64_t size,
    BytesSpan leaf_hash,
    std::span<const Digest> proof) -> std::expected<Digest, VerifyError>
{
    if (auto checked = detail::check_inclusion_inputs(hasher, index, size, leaf_hash, proof); !checked) {
        return std::unexpected(std::move(checked.error()));
    }

    const auto shape = decompose_inclusion_proof(index, size);
    auto res = detail::chain_inner(hasher, Digest(leaf_hash.begin(), leaf_hash.end()), proof.first(shape.inner), index);
    return detail::chain_border_right(hasher, std::move(res), proof.subspan(shape.inner));
}

/// Verifies that leaf_hash sits at index in the tree of the given size whose
/// root is root. The leaf hash must be computed locally from the entry.
template <LogHasher H>
[[nodiscard]] VerifyResult verify_inclusion(const H& hasher,
    uint64_t index,
    uint64_t size,
    BytesSpan leaf_hash,
    std::span<const Digest> proof,
    BytesSpan root)
{
    if (auto checked = detail::check_inclusion_inputs(hasher, index, size, leaf_hash, proof); !checked) {
        return checked;
    }
    if (root.size() != hasher.size()) {
        return detail::fail(Error::RootHashSize);
    }

    auto calculated = root_from_inclusion_proof(hasher, index, size, leaf_hash, proof);
    if (!calculated) {
        return std::unexpected(std::move(calculated.error()));
    }
    return detail::verify_match(*calculated, root);
}

/// Verifies that the tree of size2 with root2 is an append-only extension of
/// the tree of size1 with root1.
///
/// Both roots are re-derived from the same proof: root1 from the hashes that
/// were already final at size1, root2 from the full authentication path of
/// the last leaf of the first tree.
template <LogHasher H>
[[nodiscard]] VerifyResult verify_consistency(const H& hasher,
    uint64_t size1,
    uint64_t size2,
    std::span<const Digest> proof,
    BytesSpan root1,
    BytesSpan root2)
{
    if (size2 < size1) {
        return detail::fail(Error::SizesOutOfOrder);
    }
    if (size1 == size2) {
        if (!proof.empty()) {
            return detail::fail(Error::UnexpectedProof);
        }
        return detail::verify_match(root1, root2);
    }
    if (size1 == 0) {
        // 空树与任何树一致
        if (!proof.empty()) {
            return detail::fail(Error::UnexpectedProof);
        }
        return {};
    }
    if (proof.empty()) {
        return detail::fail(Error::EmptyProof);
    }
    if (root1.size() != hasher.size() || root2.size() != hasher.size()) {
        return detail::fail(Error::RootHashSize);
    }
    if (!detail::all_sized(proof, hasher.size())) {
        return detail::fail(Error::ProofHashSize);
    }

    auto [inner, border] = decompose_inclusion_proof(size1 - 1, size2);
    const auto shift = static_cast<size_t>(std::countr_zero(size1));
    inner -= shift;

    // size1 是 2 的幂时，它的 root 本身就是 size2 树中的一个完整子树，直接作为种子
    const bool complete = size1 == (uint64_t { 1 } << shift);
    Digest seed = complete ? Digest(root1.begin(), root1.end()) : proof.front();
    const size_t start = complete ? 0 : 1;

    if (proof.size() != start + inner + border) {
        return detail::fail(Error::WrongProofSize);
    }

    const auto rest = proof.subspan(start);
    const auto inner_part = rest.first(inner);
    const auto border_part = rest.subspan(inner);
    const uint64_t mask = (size1 - 1) >> shift;

    auto hash1 = detail::chain_inner_right(hasher, seed, inner_part, mask);
    hash1 = detail::chain_border_right(hasher, std::move(hash1), border_part);
    if (auto matched = detail::verify_match(hash1, root1); !matched) {
        return matched;
    }

    auto hash2 = detail::chain_inner(hasher, std::move(seed), inner_part, mask);
    hash2 = detail::chain_border_right(hasher, std::move(hash2), border_part);
    return detail::verify_match(hash2, root2);
}

} // namespace Rektor::Merkle
