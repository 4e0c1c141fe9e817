#pragma once

#include "hpkc/aead/aead.hpp"

namespace hpkc::aead {
    inline constexpr AeadParams kChaCha20Poly1305Params{AeadId::ChaCha20Poly1305, 32, 12, 16, "ChaCha20Poly1305"};

    // IETF ChaCha20-Poly1305 (RFC 8439) through libsodium.
    class ChaCha20Poly1305Aead final : public Aead {
    public:
        explicit ChaCha20Poly1305Aead(BufferView key) noexcept;
        ~ChaCha20Poly1305Aead() override;

        ChaCha20Poly1305Aead(const ChaCha20Poly1305Aead&) = delete;
        ChaCha20Poly1305Aead& operator=(const ChaCha20Poly1305Aead&) = delete;

        [[nodiscard]] const AeadParams& params() const noexcept override { return kChaCha20Poly1305Params; }

        hpkc::core::Status encrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferMut tag_out) noexcept override;

        hpkc::core::Status decrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferView tag) noexcept override;

    private:
        u8 key_[32]{};
    };

    // sodium_init() wrapper; Unavailable if libsodium cannot initialise.
    hpkc::core::Status ensure_sodium() noexcept;

} // namespace hpkc::aead
