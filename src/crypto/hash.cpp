#include "hpkc/crypto/hash.hpp"

#include <cstddef>

#include <openssl/evp.h>

namespace hpkc::crypto {
    namespace {
        using hpkc::core::make_status;
        using hpkc::core::StatusCode;
        using hpkc::core::StatusDomain;

        [[nodiscard]] const EVP_MD* evp_md_for(HashAlgorithm alg) noexcept {
            switch (alg) {
                case HashAlgorithm::Sha256: return EVP_sha256();
                case HashAlgorithm::Sha384: return EVP_sha384();
                case HashAlgorithm::Sha512: return EVP_sha512();
            }
            return nullptr;
        }
    } // namespace

    const char* hash_name(HashAlgorithm alg) noexcept {
        switch (alg) {
            case HashAlgorithm::Sha256: return "SHA256";
            case HashAlgorithm::Sha384: return "SHA384";
            case HashAlgorithm::Sha512: return "SHA512";
        }
        return "unknown";
    }

    Hasher::~Hasher() {
        EVP_MD_CTX_free(ctx_);
    }

    hpkc::core::Status Hasher::init(HashAlgorithm alg) noexcept {
        active_ = false;
        const EVP_MD* md = evp_md_for(alg);
        if (md == nullptr) {
            return make_status(StatusDomain::Hash, StatusCode::Unsupported);
        }
        if (ctx_ == nullptr) {
            ctx_ = EVP_MD_CTX_new();
            if (ctx_ == nullptr) {
                return make_status(StatusDomain::Hash, StatusCode::Unavailable);
            }
        }
        if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
            return make_status(StatusDomain::Hash, StatusCode::Crypto);
        }
        alg_ = alg;
        active_ = true;
        return hpkc::core::ok_status();
    }

    hpkc::core::Status Hasher::update(BufferView data) noexcept {
        if (!active_ || !hpkc::core::buffer_ok(data)) {
            return make_status(StatusDomain::Hash, StatusCode::Invalid);
        }
        if (data.len == 0) {
            return hpkc::core::ok_status();
        }
        if (EVP_DigestUpdate(ctx_, data.data, static_cast<size_t>(data.len)) != 1) {
            return make_status(StatusDomain::Hash, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }

    hpkc::core::Status Hasher::finalize(BufferMut out) noexcept {
        if (!active_ || out.data == nullptr || out.len < output_size()) {
            return make_status(StatusDomain::Hash, StatusCode::Invalid);
        }
        active_ = false;

        unsigned int written = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data, &written) != 1 || written != output_size()) {
            return make_status(StatusDomain::Hash, StatusCode::Crypto);
        }
        return hpkc::core::ok_status();
    }

    hpkc::core::Status hash_compute(HashAlgorithm alg, BufferView data, BufferMut out) noexcept {
        Hasher h;
        hpkc::core::Status s = h.init(alg);
        if (!hpkc::core::is_ok(s)) {
            return s;
        }
        s = h.update(data);
        if (!hpkc::core::is_ok(s)) {
            return s;
        }
        return h.finalize(out);
    }
} // namespace hpkc::crypto
