#include "hpkc/core/errors.hpp"

namespace hpkc::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::InvalidLength: return "InvalidLength";
            case StatusCode::Crypto: return "Crypto";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Hash: return "Hash";
            case StatusDomain::Kdf: return "Kdf";
            case StatusDomain::Aead: return "Aead";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace hpkc::core
