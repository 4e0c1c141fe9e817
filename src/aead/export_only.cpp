#include "hpkc/aead/export_only.hpp"

#include "hpkc/core/fatal.hpp"

namespace hpkc::aead {
    hpkc::core::Status ExportOnlyAead::encrypt_in_place_detached(BufferView,
        BufferView,
        BufferMut,
        BufferMut) noexcept {
        hpkc::core::fatal("cannot encrypt with an export-only context");
    }

    hpkc::core::Status ExportOnlyAead::decrypt_in_place_detached(BufferView,
        BufferView,
        BufferMut,
        BufferView) noexcept {
        hpkc::core::fatal("cannot decrypt with an export-only context");
    }
} // namespace hpkc::aead
