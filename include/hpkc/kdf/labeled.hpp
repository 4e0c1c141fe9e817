#pragma once

#include "hpkc/core/errors.hpp"
#include "hpkc/core/types.hpp"
#include "hpkc/kdf/hkdf.hpp"

namespace hpkc::kdf {
    // Prepended to every labeled IKM and info string. Changing it breaks
    // interoperability with every other implementation.
    inline constexpr char kVersionLabel[] = "HPKE-v1";
    inline constexpr u32 kVersionLabelLen = sizeof(kVersionLabel) - 1;

    // L is carried as I2OSP(L, 2) in the labeled info.
    inline constexpr u32 kMaxLabeledOutput = 0xFFFFu;

    // LabeledExtract(salt, label, ikm):
    //   labeled_ikm = concat("HPKE-v1", suite_id, label, ikm)
    //   return Extract(salt, labeled_ikm)
    // Any input may be empty. The PRK carries alg for later expansion.
    hpkc::core::Status labeled_extract(HashAlgorithm alg,
        BufferView salt,
        BufferView suite_id,
        BufferView label,
        BufferView ikm,
        Prk* out) noexcept;

    // LabeledExpand(prk, label, info, L):
    //   labeled_info = concat(I2OSP(L, 2), "HPKE-v1", suite_id, label, info)
    //   return Expand(prk, labeled_info, L)
    // L = out.len. L above hkdf_max_output() is InvalidLength. L above 65535
    // cannot be encoded and is a fatal precondition failure.
    hpkc::core::Status labeled_expand(const Prk& prk,
        BufferView suite_id,
        BufferView label,
        BufferView info,
        BufferMut out) noexcept;

    // ExtractAndExpand(dh, kem_context):
    //   eae_prk = LabeledExtract("", "eae_prk", dh)
    //   return LabeledExpand(eae_prk, "shared_secret", kem_context, Nsecret)
    // Nsecret = out.len.
    hpkc::core::Status extract_and_expand(HashAlgorithm alg,
        BufferView shared_secret,
        BufferView suite_id,
        BufferView context,
        BufferMut out) noexcept;

} // namespace hpkc::kdf
