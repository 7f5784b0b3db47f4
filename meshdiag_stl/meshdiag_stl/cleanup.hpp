// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>
#include <utility>

namespace meshdiag::stl {

// Runs a callable when leaving the enclosing scope, including by exception:
//
//   auto release = meshdiag::stl::make_cleanup([&tunnel]() { tunnel->close(); });
//   std::string address = tunnel->open();  // may throw, the tunnel is still released
//
// The callable must not throw.
template <typename Callable>
class [[nodiscard]] Cleanup final {
public:
    explicit Cleanup(Callable callable) : callable_(std::move(callable)) {}
    ~Cleanup() { callable_(); }

    Cleanup(const Cleanup&) = delete;
    Cleanup& operator=(const Cleanup&) = delete;
    Cleanup(Cleanup&&) = delete;
    Cleanup& operator=(Cleanup&&) = delete;

private:
    Callable callable_;
};

template <typename Callable>
Cleanup<std::decay_t<Callable>> make_cleanup(Callable&& callable) {
    return Cleanup<std::decay_t<Callable>>(std::forward<Callable>(callable));
}

}  // namespace meshdiag::stl
