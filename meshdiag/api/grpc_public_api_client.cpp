// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

// PIMPL implementation for GrpcPublicApiClient
// This hides gRPC includes from the header file to prevent conflicts

#include <api/grpc_public_api_client.hpp>

#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>
#include <grpcpp/grpcpp.h>
#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>

#include "public_api.grpc.pb.h"

using grpc::ClientContext;
using grpc::Status;

namespace meshdiag::api {

static constexpr uint16_t PUBLIC_API_PORT = 8085;

struct GrpcPublicApiClient::Impl {
    std::string target;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<Api::Stub> stub;

    explicit Impl(const std::string& t) :
        target(t), channel(grpc::CreateChannel(t, grpc::InsecureChannelCredentials())), stub(Api::NewStub(channel)) {}
};

static void set_deadline(ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

static void throw_if_failed(const Status& status, const char* rpc, const std::string& target) {
    if (!status.ok()) {
        throw std::runtime_error(fmt::format(
            "{} RPC to {} failed: {} (code {})",
            rpc,
            target,
            status.error_message(),
            static_cast<int>(status.error_code())));
    }
}

static healthcheck::SubsystemResult to_subsystem_result(const CheckResult& result) {
    return healthcheck::SubsystemResult{
        .subsystem_name = result.subsystem_name(),
        .status = result.status() == OK ? healthcheck::SubsystemStatus::Ok : healthcheck::SubsystemStatus::NotOk,
        .friendly_message = result.friendly_message_to_user(),
        .description = result.check_description(),
    };
}

std::string public_api_target(const std::string& control_plane_namespace, const std::string& api_addr) {
    if (!api_addr.empty()) {
        return api_addr;
    }
    MESHDIAG_FATAL(!control_plane_namespace.empty(), "A control plane namespace or an API address is required");
    return fmt::format("linkerd-controller-api.{}.svc.cluster.local:{}", control_plane_namespace, PUBLIC_API_PORT);
}

GrpcPublicApiClient::GrpcPublicApiClient(const std::string& target) : impl_(std::make_unique<Impl>(target)) {
    log_debug(tt::LogAlways, "[PublicApi] Created gRPC client for {}", target);
}

GrpcPublicApiClient::~GrpcPublicApiClient() = default;

const std::string& GrpcPublicApiClient::target() const { return impl_->target; }

healthcheck::SelfCheckResponse GrpcPublicApiClient::self_check(std::chrono::milliseconds timeout) {
    ClientContext context;
    set_deadline(context, timeout);

    SelfCheckRequest request;
    SelfCheckResponse reply;
    Status status = impl_->stub->SelfCheck(&context, request, &reply);
    throw_if_failed(status, "SelfCheck", impl_->target);

    healthcheck::SelfCheckResponse response;
    response.results.reserve(reply.results_size());
    for (const auto& result : reply.results()) {
        response.results.push_back(to_subsystem_result(result));
    }
    log_debug(tt::LogAlways, "[PublicApi] SelfCheck returned {} subsystem result(s)", response.results.size());
    return response;
}

std::string GrpcPublicApiClient::server_version(std::chrono::milliseconds timeout) {
    ClientContext context;
    set_deadline(context, timeout);

    VersionRequest request;
    VersionInfo reply;
    Status status = impl_->stub->Version(&context, request, &reply);
    throw_if_failed(status, "Version", impl_->target);
    return reply.release_version();
}

std::shared_ptr<PublicApiClient> make_grpc_public_api_client(
    const std::string& control_plane_namespace, const std::string& api_addr) {
    return std::make_shared<GrpcPublicApiClient>(public_api_target(control_plane_namespace, api_addr));
}

}  // namespace meshdiag::api
