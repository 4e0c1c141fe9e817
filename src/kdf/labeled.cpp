#include "hpkc/kdf/labeled.hpp"

#include "hpkc/core/fatal.hpp"
#include "hpkc/kdf/registry.hpp"

namespace hpkc::kdf {
    namespace {
        [[nodiscard]] BufferView version_label() noexcept {
            return hpkc::core::literal(kVersionLabel);
        }
    } // namespace

    hpkc::core::Status labeled_extract(HashAlgorithm alg,
        BufferView salt,
        BufferView suite_id,
        BufferView label,
        BufferView ikm,
        Prk* out) noexcept {
        const BufferView labeled_ikm[] = {version_label(), suite_id, label, ikm};
        return hkdf_extract(alg, salt, labeled_ikm, 4, out);
    }

    hpkc::core::Status labeled_expand(const Prk& prk,
        BufferView suite_id,
        BufferView label,
        BufferView info,
        BufferMut out) noexcept {
        if (out.len > kMaxLabeledOutput) {
            hpkc::core::fatal("labeled_expand: output length does not fit in 16 bits");
        }

        u8 len_buf[2]{};
        i2osp2(static_cast<u16>(out.len), len_buf);

        const BufferView labeled_info[] = {BufferView{len_buf, 2}, version_label(), suite_id, label, info};
        return hkdf_expand(prk, labeled_info, 5, out);
    }

    hpkc::core::Status extract_and_expand(HashAlgorithm alg,
        BufferView shared_secret,
        BufferView suite_id,
        BufferView context,
        BufferMut out) noexcept {
        Prk eae_prk;
        const hpkc::core::Status s = labeled_extract(
            alg, BufferView{nullptr, 0}, suite_id, hpkc::core::literal("eae_prk"), shared_secret, &eae_prk);
        if (!hpkc::core::is_ok(s)) {
            return s;
        }
        return labeled_expand(eae_prk, suite_id, hpkc::core::literal("shared_secret"), context, out);
    }
} // namespace hpkc::kdf
