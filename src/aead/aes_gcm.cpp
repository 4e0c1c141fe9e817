#include "hpkc/aead/aes_gcm.hpp"

#include <cstring>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace hpkc::aead {
    namespace {
        using hpkc::core::make_status;
        using hpkc::core::StatusCode;
        using hpkc::core::StatusDomain;

        [[nodiscard]] const EVP_CIPHER* cipher_for(AeadId id) noexcept {
            return (id == AeadId::Aes256Gcm) ? EVP_aes_256_gcm() : EVP_aes_128_gcm();
        }

        [[nodiscard]] bool check_args(const AeadParams& p, BufferView nonce, BufferView aad, BufferMut inout, u32 tag_len) noexcept {
            if (!hpkc::core::buffer_ok(nonce) || !hpkc::core::buffer_ok(aad) || !hpkc::core::buffer_ok(inout)) {
                return false;
            }
            if (nonce.len != p.nonce_size || tag_len != p.tag_size) {
                return false;
            }
            // EVP lengths are int
            return inout.len <= 0x7fffffffu && aad.len <= 0x7fffffffu;
        }
    } // namespace

    AesGcmAead::AesGcmAead(const AeadParams& params, BufferView key) noexcept : params_(params) {
        if (key.data != nullptr && key.len == params_.key_size && key.len <= sizeof(key_)) {
            std::memcpy(key_, key.data, key.len);
        }
    }

    AesGcmAead::~AesGcmAead() {
        OPENSSL_cleanse(key_, sizeof(key_));
    }

    hpkc::core::Status AesGcmAead::encrypt_in_place_detached(BufferView nonce,
        BufferView aad,
        BufferMut inout,
        BufferMut tag_out) noexcept {
        if (tag_out.data == nullptr || !check_args(params_, nonce, aad, inout, tag_out.len)) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return make_status(StatusDomain::Aead, StatusCode::Unavailable);
        }

        int ok = 1;
        int out_len = 0;
        u8 scratch[16]{};

        ok &= EVP_EncryptInit_ex(ctx, cipher_for(params_.id), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.len), nullptr);
        ok &= EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_, nonce.data);

        if (ok && aad.len > 0) {
            ok &= EVP_EncryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int written = 0;
        if (ok && inout.len > 0) {
            ok &= EVP_EncryptUpdate(ctx, inout.data, &out_len, inout.data, static_cast<int>(inout.len));
            written += out_len;
        }

        if (ok) {
            ok &= EVP_EncryptFinal_ex(ctx, scratch, &out_len);
            written += out_len;
        }
        if (ok) {
            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_out.len), tag_out.data);
        }
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || static_cast<u32>(written) != inout.len) {
            return make_status(StatusDomain::Aead, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }

    hpkc::core::Status AesGcmAead::decrypt_in_place_detached(BufferView nonce,
        BufferView aad,
        BufferMut inout,
        BufferView tag) noexcept {
        if (tag.data == nullptr || !check_args(params_, nonce, aad, inout, tag.len)) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return make_status(StatusDomain::Aead, StatusCode::Unavailable);
        }

        int ok = 1;
        int out_len = 0;
        u8 scratch[16]{};

        ok &= EVP_DecryptInit_ex(ctx, cipher_for(params_.id), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.len), nullptr);
        ok &= EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_, nonce.data);

        if (ok && aad.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }
        if (ok && inout.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, inout.data, &out_len, inout.data, static_cast<int>(inout.len));
        }
        if (ok) {
            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.len), const_cast<u8*>(tag.data));
        }
        if (!ok) {
            EVP_CIPHER_CTX_free(ctx);
            return make_status(StatusDomain::Aead, StatusCode::Crypto);
        }

        // Tag check happens here.
        const int verified = EVP_DecryptFinal_ex(ctx, scratch, &out_len);
        EVP_CIPHER_CTX_free(ctx);

        if (verified <= 0) {
            if (inout.len > 0) {
                OPENSSL_cleanse(inout.data, inout.len);
            }
            return make_status(StatusDomain::Aead, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }
} // namespace hpkc::aead
