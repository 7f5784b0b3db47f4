// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
 * grpc_public_api_client.hpp
 *
 * gRPC implementation of PublicApiClient. The implementation is hidden behind a PIMPL so gRPC
 * and generated protobuf headers do not leak to users of this header.
 */

#include <memory>
#include <string>

#include <api/public_api_client.hpp>

namespace meshdiag::api {

class GrpcPublicApiClient : public PublicApiClient {
public:
    // `target` is a gRPC target such as "linkerd-controller-api.linkerd.svc.cluster.local:8085".
    explicit GrpcPublicApiClient(const std::string& target);
    ~GrpcPublicApiClient() override;

    GrpcPublicApiClient(const GrpcPublicApiClient&) = delete;
    GrpcPublicApiClient& operator=(const GrpcPublicApiClient&) = delete;

    healthcheck::SelfCheckResponse self_check(std::chrono::milliseconds timeout) override;
    std::string server_version(std::chrono::milliseconds timeout) override;

    const std::string& target() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Resolves the API address for a control plane namespace: `api_addr` when given, otherwise the
// in-cluster service name of the public API in `control_plane_namespace`.
std::string public_api_target(const std::string& control_plane_namespace, const std::string& api_addr);

// Factory suitable for HealthCheckCollaborators.
std::shared_ptr<PublicApiClient> make_grpc_public_api_client(
    const std::string& control_plane_namespace, const std::string& api_addr);

}  // namespace meshdiag::api
