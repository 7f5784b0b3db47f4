// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace meshdiag::stl {

// Combines lambdas into one visitor for std::visit:
//
//   std::visit(
//       meshdiag::stl::overloaded{
//           [](const LocalCheck& check) { ... },
//           [](const RemoteCheck& check) { ... },
//       },
//       check.kind);
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace meshdiag::stl
