#include "hpkc/kdf/registry.hpp"

#include <cstring>

namespace hpkc::kdf {
    hpkc::core::Status kdf_suite(u16 id, KdfSuite* out) noexcept {
        if (out == nullptr) {
            return hpkc::core::make_status(hpkc::core::StatusDomain::Kdf, hpkc::core::StatusCode::Invalid);
        }
        for (const KdfSuite& s : kKdfSuites) {
            if (kdf_id_value(s.id) == id) {
                *out = s;
                return hpkc::core::ok_status();
            }
        }
        return hpkc::core::make_status(hpkc::core::StatusDomain::Kdf, hpkc::core::StatusCode::Unsupported, id);
    }

    KemSuiteId kem_suite_id(u16 kem_id) noexcept {
        KemSuiteId out{};
        std::memcpy(out.b, "KEM", 3);
        i2osp2(kem_id, out.b + 3);
        return out;
    }

    HpkeSuiteId hpke_suite_id(u16 kem_id, u16 kdf_id, u16 aead_id) noexcept {
        HpkeSuiteId out{};
        std::memcpy(out.b, "HPKE", 4);
        i2osp2(kem_id, out.b + 4);
        i2osp2(kdf_id, out.b + 6);
        i2osp2(aead_id, out.b + 8);
        return out;
    }
} // namespace hpkc::kdf
