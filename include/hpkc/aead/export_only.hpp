#pragma once

#include "hpkc/aead/aead.hpp"

namespace hpkc::aead {
    // Parameters for ciphersuites that only derive exporter secrets.
    // The nonce is wider than any u64 sequence counter so that a caller's
    // counter-to-nonce arithmetic can never fail before seal/open is reached.
    inline constexpr AeadParams kExportOnlyParams{AeadId::ExportOnly, 0, 128, 0, "Export-only"};

    // An AEAD with no cipher behind it. Encrypt and decrypt never return:
    // both report the misuse on stderr and abort the process.
    class ExportOnlyAead final : public Aead {
    public:
        ExportOnlyAead() noexcept = default;

        // No key exists for this variant; whatever is passed is discarded.
        explicit ExportOnlyAead(BufferView) noexcept {}

        [[nodiscard]] const AeadParams& params() const noexcept override { return kExportOnlyParams; }

        [[noreturn]] hpkc::core::Status encrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferMut tag_out) noexcept override;

        [[noreturn]] hpkc::core::Status decrypt_in_place_detached(BufferView nonce,
            BufferView aad,
            BufferMut inout,
            BufferView tag) noexcept override;
    };

    static_assert(kExportOnlyParams.nonce_size > sizeof(hpkc::core::u64));

} // namespace hpkc::aead
