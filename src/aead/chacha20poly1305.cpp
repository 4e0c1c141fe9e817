#include "hpkc/aead/chacha20poly1305.hpp"

#include <cstring>

#include <sodium.h>

namespace hpkc::aead {
    namespace {
        using hpkc::core::make_status;
        using hpkc::core::StatusCode;
        using hpkc::core::StatusDomain;

        static_assert(crypto_aead_chacha20poly1305_IETF_KEYBYTES == 32);
        static_assert(crypto_aead_chacha20poly1305_IETF_NPUBBYTES == 12);
        static_assert(crypto_aead_chacha20poly1305_IETF_ABYTES == 16);

        [[nodiscard]] bool check_args(BufferView nonce, BufferView aad, BufferMut inout, u32 tag_len) noexcept {
            if (!hpkc::core::buffer_ok(nonce) || !hpkc::core::buffer_ok(aad) || !hpkc::core::buffer_ok(inout)) {
                return false;
            }
            return nonce.len == kChaCha20Poly1305Params.nonce_size && tag_len == kChaCha20Poly1305Params.tag_size;
        }
    } // namespace

    hpkc::core::Status ensure_sodium() noexcept {
        if (sodium_init() < 0) {
            return make_status(StatusDomain::External, StatusCode::Unavailable);
        }
        return hpkc::core::ok_status();
    }

    ChaCha20Poly1305Aead::ChaCha20Poly1305Aead(BufferView key) noexcept {
        if (key.data != nullptr && key.len == sizeof(key_)) {
            std::memcpy(key_, key.data, sizeof(key_));
        }
    }

    ChaCha20Poly1305Aead::~ChaCha20Poly1305Aead() {
        sodium_memzero(key_, sizeof(key_));
    }

    hpkc::core::Status ChaCha20Poly1305Aead::encrypt_in_place_detached(BufferView nonce,
        BufferView aad,
        BufferMut inout,
        BufferMut tag_out) noexcept {
        if (tag_out.data == nullptr || !check_args(nonce, aad, inout, tag_out.len)) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }

        u8 empty = 0;
        u8* buf = (inout.len > 0) ? inout.data : &empty;
        unsigned long long mac_len = 0;

        const int rc = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
            buf,
            tag_out.data,
            &mac_len,
            buf,
            static_cast<unsigned long long>(inout.len),
            aad.data,
            static_cast<unsigned long long>(aad.len),
            nullptr,
            nonce.data,
            key_);

        if (rc != 0 || mac_len != tag_out.len) {
            return make_status(StatusDomain::Aead, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }

    hpkc::core::Status ChaCha20Poly1305Aead::decrypt_in_place_detached(BufferView nonce,
        BufferView aad,
        BufferMut inout,
        BufferView tag) noexcept {
        if (tag.data == nullptr || !check_args(nonce, aad, inout, tag.len)) {
            return make_status(StatusDomain::Aead, StatusCode::Invalid);
        }

        u8 empty = 0;
        u8* buf = (inout.len > 0) ? inout.data : &empty;

        const int rc = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
            buf,
            nullptr,
            buf,
            static_cast<unsigned long long>(inout.len),
            tag.data,
            aad.data,
            static_cast<unsigned long long>(aad.len),
            nonce.data,
            key_);

        if (rc != 0) {
            if (inout.len > 0) {
                sodium_memzero(inout.data, inout.len);
            }
            return make_status(StatusDomain::Aead, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }
} // namespace hpkc::aead
