#pragma once

#include "hpkc/core/errors.hpp"
#include "hpkc/core/types.hpp"
#include "hpkc/crypto/hash.hpp"

namespace hpkc::kdf {
    using u8 = hpkc::core::u8;
    using u16 = hpkc::core::u16;
    using u32 = hpkc::core::u32;
    using BufferView = hpkc::core::BufferView;
    using BufferMut = hpkc::core::BufferMut;
    using HashAlgorithm = hpkc::crypto::HashAlgorithm;

    // Pseudorandom key produced by an extract step, bound to the hash that
    // produced it so that expansion always runs over the same HMAC.
    // Wiped on destruction; callers holding copies are responsible for them.
    struct Prk {
        HashAlgorithm hash{HashAlgorithm::Sha256};
        u32 len{0};
        u8 b[hpkc::crypto::kMaxHashSize]{};

        Prk() noexcept = default;
        Prk(const Prk&) noexcept = default;
        Prk& operator=(const Prk&) noexcept = default;
        ~Prk();

        void clear() noexcept;

        [[nodiscard]] BufferView view() const noexcept { return BufferView{b, len}; }
    };

    // Upper bound on HKDF-Expand output for a hash: 255 * Nh.
    [[nodiscard]] constexpr u32 hkdf_max_output(HashAlgorithm alg) noexcept {
        return 255u * hpkc::crypto::hash_output_size(alg);
    }

    // Imports externally supplied PRK bytes. Length must be within [Nh, 64].
    hpkc::core::Status prk_from_bytes(HashAlgorithm alg, BufferView bytes, Prk* out) noexcept;

    // HKDF-Extract (RFC 5869 2.2). The IKM is the concatenation of ikm_parts;
    // an empty salt is treated as Nh zero bytes.
    hpkc::core::Status hkdf_extract(HashAlgorithm alg,
        BufferView salt,
        const BufferView* ikm_parts,
        u32 part_count,
        Prk* out) noexcept;

    hpkc::core::Status hkdf_extract(HashAlgorithm alg,
        BufferView salt,
        BufferView ikm,
        Prk* out) noexcept;

    // HKDF-Expand (RFC 5869 2.3). The info string is the concatenation of
    // info_parts. Fills out.len bytes; more than hkdf_max_output() is
    // InvalidLength and leaves out untouched.
    hpkc::core::Status hkdf_expand(const Prk& prk,
        const BufferView* info_parts,
        u32 part_count,
        BufferMut out) noexcept;

    hpkc::core::Status hkdf_expand(const Prk& prk, BufferView info, BufferMut out) noexcept;

} // namespace hpkc::kdf
