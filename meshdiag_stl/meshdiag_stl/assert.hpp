// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <tt-logger/tt-logger.hpp>

/*
 * MESHDIAG_FATAL(condition, message, args...)
 *
 * Guards caller contracts: a missing collaborator, a malformed options file, a check without a
 * function. When `condition` is false it logs the fmt-formatted message and throws
 * std::runtime_error carrying the source location, the condition text and a backtrace.
 *
 *   MESHDIAG_ASSERT_ABORT       abort() instead of throwing, for a core dump
 *   MESHDIAG_DISABLE_BACKTRACE  leave the backtrace out of the exception message
 *
 * Failing health checks never go through here; the checker engine reports them as results.
 */

namespace meshdiag::assert::detail {

struct FreeDeleter {
    void operator()(void* p) const { std::free(p); }
};

// backtrace_symbols() frames look like "binary(_ZN8meshdiag3fooEv+0x1c) [0x55d1...]".
inline std::string demangle_frame(const char* frame) {
    const std::string text(frame);
    const size_t open = text.find('(');
    const size_t plus = text.find('+', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || plus == std::string::npos || plus == open + 1) {
        return text;
    }
    const std::string mangled = text.substr(open + 1, plus - open - 1);
    int status = 0;
    std::unique_ptr<char, FreeDeleter> demangled(abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status));
    return status == 0 && demangled ? std::string(demangled.get()) : text;
}

// Call stack of the caller, innermost frame first, without the `skip` innermost frames.
inline std::vector<std::string> backtrace_frames(int max_depth = 64, int skip = 2) {
    std::vector<void*> addresses(max_depth);
    const int depth = ::backtrace(addresses.data(), max_depth);
    std::unique_ptr<char*, FreeDeleter> symbols(backtrace_symbols(addresses.data(), depth));

    std::vector<std::string> frames;
    if (!symbols) {
        return frames;
    }
    for (int i = skip; i < depth; i++) {
        frames.push_back(demangle_frame(symbols.get()[i]));
    }
    return frames;
}

template <typename... Args>
[[noreturn]] void fatal(
    const char* file,
    int line,
    const char* condition,
    fmt::format_string<const Args&...> message,
    const Args&... args) {
    const std::string info = fmt::format(message, args...);
    log_critical(tt::LogAlways, "MESHDIAG_FATAL: {}", info);
    if (std::getenv("MESHDIAG_ASSERT_ABORT")) {
        std::abort();
    }

    std::string what = fmt::format("MESHDIAG_FATAL @ {}:{}: {}\ninfo:\n{}\n", file, line, condition, info);
    static const bool disable_backtrace = std::getenv("MESHDIAG_DISABLE_BACKTRACE") != nullptr;
    if (!disable_backtrace) {
        what += "backtrace:\n";
        for (const auto& frame : backtrace_frames()) {
            what += fmt::format(" --- {}\n", frame);
        }
    }
    throw std::runtime_error(what);
}

}  // namespace meshdiag::assert::detail

#define MESHDIAG_FATAL(condition, message, ...)                                                              \
    do {                                                                                                     \
        if (not(condition)) [[unlikely]] {                                                                   \
            meshdiag::assert::detail::fatal(__FILE__, __LINE__, #condition, message __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                                                    \
    } while (0)  // NOLINT(cppcoreguidelines-macro-usage)
