#pragma once

#include <array>
#include <type_traits>

#include "hpkc/core/errors.hpp"
#include "hpkc/core/types.hpp"
#include "hpkc/crypto/hash.hpp"

namespace hpkc::kdf {
    using u8 = hpkc::core::u8;
    using u16 = hpkc::core::u16;
    using u32 = hpkc::core::u32;
    using HashAlgorithm = hpkc::crypto::HashAlgorithm;

    // Published KDF identifiers (RFC 9180 7.2). Values are wire constants and
    // must never change; new KDFs get new values.
    enum class KdfId : u16 {
        HkdfSha256 = 0x0001,
        HkdfSha384 = 0x0002,
        HkdfSha512 = 0x0003,
    };

    struct KdfSuite {
        KdfId id{KdfId::HkdfSha256};
        HashAlgorithm hash{HashAlgorithm::Sha256};
        const char* name{nullptr};
    };

    inline constexpr std::array<KdfSuite, 3> kKdfSuites = {{
        {KdfId::HkdfSha256, HashAlgorithm::Sha256, "HKDF-SHA256"},
        {KdfId::HkdfSha384, HashAlgorithm::Sha384, "HKDF-SHA384"},
        {KdfId::HkdfSha512, HashAlgorithm::Sha512, "HKDF-SHA512"},
    }};

    [[nodiscard]] constexpr KdfId kdf_id_for(HashAlgorithm alg) noexcept {
        switch (alg) {
            case HashAlgorithm::Sha256: return KdfId::HkdfSha256;
            case HashAlgorithm::Sha384: return KdfId::HkdfSha384;
            case HashAlgorithm::Sha512: return KdfId::HkdfSha512;
        }
        return KdfId::HkdfSha256;
    }

    [[nodiscard]] constexpr u16 kdf_id_value(KdfId id) noexcept {
        return static_cast<u16>(id);
    }

    // Looks up a raw identifier, e.g. one read from a negotiation message.
    // Unknown identifiers are Unsupported.
    hpkc::core::Status kdf_suite(u16 id, KdfSuite* out) noexcept;

    // I2OSP(v, 2)
    constexpr void i2osp2(u16 v, u8 out[2]) noexcept {
        out[0] = static_cast<u8>((v >> 8) & 0xffu);
        out[1] = static_cast<u8>(v & 0xffu);
    }

    struct KemSuiteId {
        u8 b[5]{};
        [[nodiscard]] hpkc::core::BufferView view() const noexcept { return {b, sizeof(b)}; }
    };

    struct HpkeSuiteId {
        u8 b[10]{};
        [[nodiscard]] hpkc::core::BufferView view() const noexcept { return {b, sizeof(b)}; }
    };

    // concat("KEM", I2OSP(kem_id, 2))
    [[nodiscard]] KemSuiteId kem_suite_id(u16 kem_id) noexcept;

    // concat("HPKE", I2OSP(kem_id, 2), I2OSP(kdf_id, 2), I2OSP(aead_id, 2))
    [[nodiscard]] HpkeSuiteId hpke_suite_id(u16 kem_id, u16 kdf_id, u16 aead_id) noexcept;

    static_assert(static_cast<u16>(KdfId::HkdfSha256) == 0x0001);
    static_assert(static_cast<u16>(KdfId::HkdfSha384) == 0x0002);
    static_assert(static_cast<u16>(KdfId::HkdfSha512) == 0x0003);
    static_assert(std::is_trivially_copyable_v<KdfSuite>);
    static_assert(std::is_trivially_copyable_v<KemSuiteId>);
    static_assert(std::is_trivially_copyable_v<HpkeSuiteId>);

} // namespace hpkc::kdf
