// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <api/public_api_client.hpp>
#include <k8s/kubernetes_api.hpp>
#include <metrics/tunnel.hpp>

namespace meshdiag::test {

class MockKubernetesApi : public k8s::KubernetesApi {
public:
    MOCK_METHOD(k8s::KubernetesVersion, get_version_info, (), (override));
    MOCK_METHOD(void, check_namespace_exists, (const std::string& namespace_name), (override));
    MOCK_METHOD(bool, namespace_exists, (const std::string& namespace_name), (override));
    MOCK_METHOD(std::vector<k8s::PodDescriptor>, list_pods, (const std::string& namespace_name), (override));
};

class MockPublicApiClient : public api::PublicApiClient {
public:
    MOCK_METHOD(healthcheck::SelfCheckResponse, self_check, (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(std::string, server_version, (std::chrono::milliseconds timeout), (override));
};

class MockTunnel : public metrics::Tunnel {
public:
    MOCK_METHOD(std::string, open, (), (override));
    MOCK_METHOD(void, close, (), (override));
};

class MockTunnelProvider : public metrics::TunnelProvider {
public:
    MOCK_METHOD(
        std::unique_ptr<metrics::Tunnel>,
        create,
        (const k8s::PodDescriptor& pod,
         const k8s::ContainerDescriptor& container,
         const std::string& port_name,
         bool emit_logs),
        (override));
};

}  // namespace meshdiag::test
