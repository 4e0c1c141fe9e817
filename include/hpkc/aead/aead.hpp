#pragma once

#include <memory>
#include <type_traits>

#include "hpkc/core/errors.hpp"
#include "hpkc/core/types.hpp"

namespace hpkc::aead {
    using u8 = hpkc::core::u8;
    using u16 = hpkc::core::u16;
    using u32 = hpkc::core::u32;
    using BufferView = hpkc::core::BufferView;
    using BufferMut = hpkc::core::BufferMut;

    // Published AEAD identifiers (RFC 9180 7.3).
    enum class AeadId : u16 {
        Aes128Gcm = 0x0001,
        Aes256Gcm = 0x0002,
        ChaCha20Poly1305 = 0x0003,
        ExportOnly = 0xFFFF,
    };

    struct AeadParams {
        AeadId id{AeadId::Aes128Gcm};
        u32 key_size{0};
        u32 nonce_size{0};
        u32 tag_size{0};
        const char* name{nullptr};
    };

    // Unknown identifiers are Unsupported.
    hpkc::core::Status aead_params(u16 id, AeadParams* out) noexcept;

    // A keyed symmetric cipher. Implementations are fixed: the concrete
    // ciphers above plus the export-only variant, built by make_aead().
    class Aead {
    public:
        virtual ~Aead() = default;

        [[nodiscard]] virtual const AeadParams& params() const noexcept = 0;

        [[nodiscard]] AeadId id() const noexcept { return params().id; }
        [[nodiscard]] u32 key_size() const noexcept { return params().key_size; }
        [[nodiscard]] u32 nonce_size() const noexcept { return params().nonce_size; }
        [[nodiscard]] u32 tag_size() const noexcept { return params().tag_size; }

        // Encrypts inout in place; the tag is written to tag_out, which must be
        // exactly tag_size() bytes.
        virtual hpkc::core::Status encrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferMut tag_out) noexcept = 0;

        // Decrypts inout in place. On authentication failure returns Crypto and
        // zeroes inout.
        virtual hpkc::core::Status decrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferView tag) noexcept = 0;
    };

    // Key length must equal key_size; the export-only variant accepts and
    // ignores any key.
    hpkc::core::Status make_aead(AeadId id, BufferView key, std::unique_ptr<Aead>* out) noexcept;

    static_assert(std::is_trivially_copyable_v<AeadParams>);

} // namespace hpkc::aead
