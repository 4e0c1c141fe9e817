#include "hpkc/kdf/hkdf.hpp"

#include <cstddef>
#include <cstring>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace hpkc::kdf {
    namespace {
        using hpkc::core::make_status;
        using hpkc::core::Status;
        using hpkc::core::StatusCode;
        using hpkc::core::StatusDomain;

        [[nodiscard]] bool parts_ok(const BufferView* parts, u32 count) noexcept {
            if (count > 0 && parts == nullptr) {
                return false;
            }
            for (u32 i = 0; i < count; ++i) {
                if (!hpkc::core::buffer_ok(parts[i])) {
                    return false;
                }
            }
            return true;
        }

        // One HMAC instance over OpenSSL's EVP_MAC. Re-keyable through init().
        class Hmac {
        public:
            explicit Hmac(HashAlgorithm alg) noexcept : alg_(alg) {
                mac_ = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
                if (mac_ != nullptr) {
                    ctx_ = EVP_MAC_CTX_new(mac_);
                }
            }

            ~Hmac() {
                EVP_MAC_CTX_free(ctx_);
                EVP_MAC_free(mac_);
            }

            Hmac(const Hmac&) = delete;
            Hmac& operator=(const Hmac&) = delete;

            [[nodiscard]] bool ready() const noexcept { return ctx_ != nullptr; }

            [[nodiscard]] bool init(BufferView key) noexcept {
                OSSL_PARAM params[2];
                params[0] = OSSL_PARAM_construct_utf8_string(
                    OSSL_MAC_PARAM_DIGEST, const_cast<char*>(hpkc::crypto::hash_name(alg_)), 0);
                params[1] = OSSL_PARAM_construct_end();
                return EVP_MAC_init(ctx_, key.data, static_cast<size_t>(key.len), params) == 1;
            }

            [[nodiscard]] bool update(BufferView data) noexcept {
                if (data.len == 0) {
                    return true;
                }
                return EVP_MAC_update(ctx_, data.data, static_cast<size_t>(data.len)) == 1;
            }

            [[nodiscard]] bool finish(u8* out, u32 expected) noexcept {
                size_t written = 0;
                if (EVP_MAC_final(ctx_, out, &written, static_cast<size_t>(expected)) != 1) {
                    return false;
                }
                return written == expected;
            }

        private:
            HashAlgorithm alg_;
            EVP_MAC* mac_{nullptr};
            EVP_MAC_CTX* ctx_{nullptr};
        };
    } // namespace

    Prk::~Prk() {
        clear();
    }

    void Prk::clear() noexcept {
        OPENSSL_cleanse(b, sizeof(b));
        len = 0;
    }

    Status prk_from_bytes(HashAlgorithm alg, BufferView bytes, Prk* out) noexcept {
        if (out == nullptr || !hpkc::core::buffer_ok(bytes)) {
            return make_status(StatusDomain::Kdf, StatusCode::Invalid);
        }
        if (!hpkc::crypto::hash_is_known(alg)) {
            return make_status(StatusDomain::Kdf, StatusCode::Unsupported);
        }
        if (bytes.len < hpkc::crypto::hash_output_size(alg) || bytes.len > sizeof(out->b)) {
            return make_status(StatusDomain::Kdf, StatusCode::Invalid);
        }

        out->clear();
        out->hash = alg;
        std::memcpy(out->b, bytes.data, bytes.len);
        out->len = bytes.len;
        return hpkc::core::ok_status();
    }

    Status hkdf_extract(HashAlgorithm alg,
        BufferView salt,
        const BufferView* ikm_parts,
        u32 part_count,
        Prk* out) noexcept {
        if (out == nullptr || !hpkc::core::buffer_ok(salt) || !parts_ok(ikm_parts, part_count)) {
            return make_status(StatusDomain::Kdf, StatusCode::Invalid);
        }
        if (!hpkc::crypto::hash_is_known(alg)) {
            return make_status(StatusDomain::Kdf, StatusCode::Unsupported);
        }

        const u32 nh = hpkc::crypto::hash_output_size(alg);

        // RFC 5869: absent salt means a string of Nh zeros.
        const u8 zeros[hpkc::crypto::kMaxHashSize]{};
        const BufferView key = (salt.len == 0) ? BufferView{zeros, nh} : salt;

        Hmac mac(alg);
        if (!mac.ready()) {
            return make_status(StatusDomain::Kdf, StatusCode::Unavailable);
        }
        if (!mac.init(key)) {
            return make_status(StatusDomain::Kdf, StatusCode::Crypto);
        }
        for (u32 i = 0; i < part_count; ++i) {
            if (!mac.update(ikm_parts[i])) {
                return make_status(StatusDomain::Kdf, StatusCode::Crypto);
            }
        }

        out->clear();
        if (!mac.finish(out->b, nh)) {
            out->clear();
            return make_status(StatusDomain::Kdf, StatusCode::Crypto);
        }
        out->hash = alg;
        out->len = nh;
        return hpkc::core::ok_status();
    }

    Status hkdf_extract(HashAlgorithm alg, BufferView salt, BufferView ikm, Prk* out) noexcept {
        return hkdf_extract(alg, salt, &ikm, 1, out);
    }

    Status hkdf_expand(const Prk& prk,
        const BufferView* info_parts,
        u32 part_count,
        BufferMut out) noexcept {
        if (!hpkc::core::buffer_ok(out) || !parts_ok(info_parts, part_count)) {
            return make_status(StatusDomain::Kdf, StatusCode::Invalid);
        }
        if (!hpkc::crypto::hash_is_known(prk.hash)) {
            return make_status(StatusDomain::Kdf, StatusCode::Unsupported);
        }

        const u32 nh = hpkc::crypto::hash_output_size(prk.hash);
        if (prk.len < nh || prk.len > sizeof(prk.b)) {
            return make_status(StatusDomain::Kdf, StatusCode::Invalid);
        }
        if (out.len > hkdf_max_output(prk.hash)) {
            return make_status(StatusDomain::Kdf, StatusCode::InvalidLength, out.len);
        }
        if (out.len == 0) {
            return hpkc::core::ok_status();
        }

        Hmac mac(prk.hash);
        if (!mac.ready()) {
            return make_status(StatusDomain::Kdf, StatusCode::Unavailable);
        }

        // T(0) = empty; T(i) = HMAC(PRK, T(i-1) || info || i)
        u8 t[hpkc::crypto::kMaxHashSize]{};
        u32 t_len = 0;
        u32 pos = 0;
        Status result = hpkc::core::ok_status();

        for (u32 counter = 1; pos < out.len; ++counter) {
            const u8 c = static_cast<u8>(counter);
            bool ok = mac.init(prk.view()) && mac.update(BufferView{t, t_len});
            for (u32 i = 0; ok && i < part_count; ++i) {
                ok = mac.update(info_parts[i]);
            }
            ok = ok && mac.update(BufferView{&c, 1}) && mac.finish(t, nh);
            if (!ok) {
                result = make_status(StatusDomain::Kdf, StatusCode::Crypto);
                break;
            }
            t_len = nh;

            const u32 take = (out.len - pos < nh) ? (out.len - pos) : nh;
            std::memcpy(out.data + pos, t, take);
            pos += take;
        }

        OPENSSL_cleanse(t, sizeof(t));
        if (!hpkc::core::is_ok(result)) {
            OPENSSL_cleanse(out.data, out.len);
        }
        return result;
    }

    Status hkdf_expand(const Prk& prk, BufferView info, BufferMut out) noexcept {
        return hkdf_expand(prk, &info, 1, out);
    }
} // namespace hpkc::kdf
