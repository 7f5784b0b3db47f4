// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <healthcheck/check.hpp>

namespace meshdiag::api {

/*
 * Client for the control plane's public API. Both calls throw std::runtime_error when the call
 * cannot complete (transport failure, deadline exceeded, non-OK status).
 */
class PublicApiClient {
public:
    virtual ~PublicApiClient() = default;

    virtual healthcheck::SelfCheckResponse self_check(std::chrono::milliseconds timeout) = 0;

    // Release version reported by the control plane, e.g. "stable-2.3.0".
    virtual std::string server_version(std::chrono::milliseconds timeout) = 0;
};

// Builds a client for the control plane in `control_plane_namespace`, reached at `api_addr`.
// Throws if the client cannot be configured.
using PublicApiClientFactory = std::function<std::shared_ptr<PublicApiClient>(
    const std::string& control_plane_namespace, const std::string& api_addr)>;

}  // namespace meshdiag::api
