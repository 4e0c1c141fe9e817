#pragma once

#include "hpkc/core/errors.hpp"
#include "hpkc/core/types.hpp"

struct evp_md_ctx_st;

namespace hpkc::crypto {
    using u8 = hpkc::core::u8;
    using u32 = hpkc::core::u32;
    using BufferView = hpkc::core::BufferView;
    using BufferMut = hpkc::core::BufferMut;

    enum class HashAlgorithm : u8 {
        Sha256 = 1,
        Sha384 = 2,
        Sha512 = 3,
    };

    // Largest Nh of any supported hash (SHA-512).
    inline constexpr u32 kMaxHashSize = 64;

    [[nodiscard]] constexpr u32 hash_output_size(HashAlgorithm alg) noexcept {
        switch (alg) {
            case HashAlgorithm::Sha256: return 32;
            case HashAlgorithm::Sha384: return 48;
            case HashAlgorithm::Sha512: return 64;
        }
        return 0;
    }

    [[nodiscard]] constexpr u32 hash_block_size(HashAlgorithm alg) noexcept {
        switch (alg) {
            case HashAlgorithm::Sha256: return 64;
            case HashAlgorithm::Sha384: return 128;
            case HashAlgorithm::Sha512: return 128;
        }
        return 0;
    }

    [[nodiscard]] constexpr bool hash_is_known(HashAlgorithm alg) noexcept {
        return hash_output_size(alg) != 0;
    }

    // Digest name as understood by the OpenSSL provider layer.
    [[nodiscard]] const char* hash_name(HashAlgorithm alg) noexcept;

    // Streaming digest. Not copyable; a Hasher owns its backend context.
    class Hasher {
    public:
        Hasher() noexcept = default;
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        hpkc::core::Status init(HashAlgorithm alg) noexcept;
        hpkc::core::Status update(BufferView data) noexcept;

        // Writes hash_output_size() bytes into out; out.len must be at least that.
        // The hasher must be re-initialised before further use.
        hpkc::core::Status finalize(BufferMut out) noexcept;

        [[nodiscard]] HashAlgorithm algorithm() const noexcept { return alg_; }
        [[nodiscard]] u32 output_size() const noexcept { return hash_output_size(alg_); }

    private:
        evp_md_ctx_st* ctx_{nullptr};
        HashAlgorithm alg_{HashAlgorithm::Sha256};
        bool active_{false};
    };

    hpkc::core::Status hash_compute(HashAlgorithm alg, BufferView data, BufferMut out) noexcept;

} // namespace hpkc::crypto
