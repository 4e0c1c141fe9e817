#pragma once

namespace hpkc::core {
    // Integration errors that no caller can recover from (misuse of an
    // export-only AEAD, protocol length limits). Prints "fatal: <msg>" to
    // stderr and aborts the process.
    [[noreturn]] void fatal(const char* msg) noexcept;
} // namespace hpkc::core
