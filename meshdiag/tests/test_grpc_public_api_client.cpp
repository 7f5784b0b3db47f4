// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <grpcpp/grpcpp.h>

#include <api/grpc_public_api_client.hpp>

#include "public_api.grpc.pb.h"

using namespace std::chrono_literals;
using namespace meshdiag;

namespace {

// In-process control plane answering SelfCheck with one healthy and one broken subsystem.
class FakeControlPlane final : public api::Api::Service {
public:
    grpc::Status SelfCheck(
        grpc::ServerContext*, const api::SelfCheckRequest*, api::SelfCheckResponse* reply) override {
        auto* healthy = reply->add_results();
        healthy->set_subsystem_name("kubernetes-api");
        healthy->set_check_description("can query the Kubernetes API");
        healthy->set_status(api::OK);

        auto* broken = reply->add_results();
        broken->set_subsystem_name("prometheus");
        broken->set_check_description("can query prometheus");
        broken->set_status(api::ERROR);
        broken->set_friendly_message_to_user("prometheus is unreachable");
        return grpc::Status::OK;
    }

    grpc::Status Version(grpc::ServerContext*, const api::VersionRequest*, api::VersionInfo* reply) override {
        reply->set_release_version("stable-2.3.0");
        return grpc::Status::OK;
    }
};

class GrpcPublicApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterService(&service_);
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port_, 0);
    }

    void TearDown() override { server_->Shutdown(); }

    std::string address() const { return fmt::format("127.0.0.1:{}", port_); }

    FakeControlPlane service_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;
};

TEST_F(GrpcPublicApiClientTest, TranslatesSelfCheckResults) {
    api::GrpcPublicApiClient client(address());
    auto response = client.self_check(5s);

    ASSERT_EQ(response.results.size(), 2);
    EXPECT_EQ(response.results[0].subsystem_name, "kubernetes-api");
    EXPECT_EQ(response.results[0].status, healthcheck::SubsystemStatus::Ok);
    EXPECT_EQ(response.results[1].status, healthcheck::SubsystemStatus::NotOk);
    EXPECT_EQ(response.results[1].friendly_message, "prometheus is unreachable");
    EXPECT_EQ(response.results[1].description, "can query prometheus");
}

TEST_F(GrpcPublicApiClientTest, ReturnsServerVersion) {
    auto client = api::make_grpc_public_api_client("linkerd", address());
    EXPECT_EQ(client->server_version(5s), "stable-2.3.0");
}

TEST(GrpcPublicApiClientUnreachableTest, FailedCallThrows) {
    api::GrpcPublicApiClient client("127.0.0.1:1");
    EXPECT_THROW(client.self_check(500ms), std::runtime_error);
}

TEST(PublicApiTargetTest, DefaultsToInClusterService) {
    EXPECT_EQ(api::public_api_target("linkerd", ""), "linkerd-controller-api.linkerd.svc.cluster.local:8085");
    EXPECT_EQ(api::public_api_target("linkerd", "localhost:9995"), "localhost:9995");
    EXPECT_THROW(api::public_api_target("", ""), std::runtime_error);
}

}  // namespace
