#include "hpkc/aead/aead.hpp"

#include <new>

#include "hpkc/aead/aes_gcm.hpp"
#include "hpkc/aead/chacha20poly1305.hpp"
#include "hpkc/aead/export_only.hpp"

namespace hpkc::aead {
    namespace {
        using hpkc::core::make_status;
        using hpkc::core::StatusCode;
        using hpkc::core::StatusDomain;

        constexpr AeadParams kAllParams[] = {
            kAes128GcmParams,
            kAes256GcmParams,
            kChaCha20Poly1305Params,
            kExportOnlyParams,
        };
    } // namespace

    hpkc::core::Status aead_params(u16 id, AeadParams* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }
        for (const AeadParams& p : kAllParams) {
            if (static_cast<u16>(p.id) == id) {
                *out = p;
                return hpkc::core::ok_status();
            }
        }
        return make_status(StatusDomain::Aead, StatusCode::Unsupported, id);
    }

    // Allocation uses nothrow new so the factory stays noexcept like the rest of
    // the library; a failed allocation is reported as Unavailable.
    hpkc::core::Status make_aead(AeadId id, BufferView key, std::unique_ptr<Aead>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }
        out->reset();

        AeadParams p{};
        const hpkc::core::Status s = aead_params(static_cast<u16>(id), &p);
        if (!hpkc::core::is_ok(s)) {
            return s;
        }

        if (id == AeadId::ExportOnly) {
            out->reset(new (std::nothrow) ExportOnlyAead(key));
        } else {
            if (key.data == nullptr || key.len != p.key_size) {
                return make_status(StatusDomain::Aead, StatusCode::Invalid, key.len);
            }
            if (id == AeadId::ChaCha20Poly1305) {
                const hpkc::core::Status init = ensure_sodium();
                if (!hpkc::core::is_ok(init)) {
                    return init;
                }
                out->reset(new (std::nothrow) ChaCha20Poly1305Aead(key));
            } else {
                out->reset(new (std::nothrow) AesGcmAead(p, key));
            }
        }

        if (!*out) {
            return make_status(StatusDomain::Aead, StatusCode::Unavailable);
        }
        return hpkc::core::ok_status();
    }
} // namespace hpkc::aead
