#include "hpkc/core/fatal.hpp"

#include <cstdio>
#include <cstdlib>

namespace hpkc::core {
    void fatal(const char* msg) noexcept {
        std::fprintf(stderr, "fatal: %s\n", (msg != nullptr) ? msg : "unspecified");
        std::fflush(stderr);
        std::abort();
    }
} // namespace hpkc::core
