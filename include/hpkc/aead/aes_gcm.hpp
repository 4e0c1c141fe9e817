#pragma once

#include "hpkc/aead/aead.hpp"

namespace hpkc::aead {
    inline constexpr AeadParams kAes128GcmParams{AeadId::Aes128Gcm, 16, 12, 16, "AES-128-GCM"};
    inline constexpr AeadParams kAes256GcmParams{AeadId::Aes256Gcm, 32, 12, 16, "AES-256-GCM"};

    // AES-GCM through OpenSSL EVP. The key length has been checked by make_aead().
    class AesGcmAead final : public Aead {
    public:
        AesGcmAead(const AeadParams& params, BufferView key) noexcept;
        ~AesGcmAead() override;

        AesGcmAead(const AesGcmAead&) = delete;
        AesGcmAead& operator=(const AesGcmAead&) = delete;

        [[nodiscard]] const AeadParams& params() const noexcept override { return params_; }

        hpkc::core::Status encrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferMut tag_out) noexcept override;

        hpkc::core::Status decrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferView tag) noexcept override;

    private:
        AeadParams params_;
        u8 key_[32]{};
    };

} // namespace hpkc::aead
