// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <k8s/rest_kubernetes_api.hpp>

using namespace std::chrono_literals;
using namespace meshdiag::k8s;
using json = nlohmann::json;

namespace {

constexpr const char* POD_LIST = R"({
  "kind": "PodList",
  "items": [
    {
      "metadata": {"name": "linkerd-controller-7b9f", "namespace": "linkerd"},
      "spec": {"containers": [
        {"name": "public-api", "ports": [{"name": "http", "containerPort": 8085}]},
        {"name": "linkerd-proxy", "ports": [{"name": "linkerd-admin", "containerPort": 4191}]}
      ]},
      "status": {"phase": "Running", "podIP": "10.42.0.7"}
    },
    {
      "metadata": {"name": "linkerd-web-5d4c", "namespace": "linkerd"},
      "spec": {"containers": [{"name": "web"}]},
      "status": {"phase": "Pending"}
    }
  ]
})";

TEST(NamespacePathTest, BuildsNamespacedPaths) {
    EXPECT_EQ(namespace_path("linkerd"), "/api/v1/namespaces/linkerd");
    EXPECT_EQ(namespace_path("linkerd", "/pods"), "/api/v1/namespaces/linkerd/pods");
    EXPECT_THROW(namespace_path("linkerd", "pods"), std::invalid_argument);
}

TEST(ParseVersionInfoTest, HandlesProviderSuffixes) {
    auto version = parse_version_info(json::parse(R"({"major": "1", "minor": "27+", "gitVersion": "v1.27.3-eks"})"));
    EXPECT_EQ(version.major, 1);
    EXPECT_EQ(version.minor, 27);
    EXPECT_EQ(version.git_version, "v1.27.3-eks");

    EXPECT_THROW(parse_version_info(json::parse(R"({"major": "", "minor": "27"})")), std::runtime_error);
}

TEST(ParsePodListTest, ReadsPhasesIpsAndPorts) {
    auto pods = parse_pod_list(json::parse(POD_LIST));
    ASSERT_EQ(pods.size(), 2);

    EXPECT_EQ(pods[0].name, "linkerd-controller-7b9f");
    EXPECT_EQ(pods[0].namespace_name, "linkerd");
    EXPECT_TRUE(pods[0].running());
    EXPECT_EQ(pods[0].pod_ip, "10.42.0.7");
    ASSERT_EQ(pods[0].containers.size(), 2);
    const ContainerPort* admin = pods[0].containers[1].find_port("linkerd-admin");
    ASSERT_NE(admin, nullptr);
    EXPECT_EQ(admin->container_port, 4191);
    EXPECT_EQ(pods[0].containers[0].find_port("linkerd-admin"), nullptr);

    EXPECT_EQ(pods[1].phase, PodPhase::Pending);
    EXPECT_TRUE(pods[1].pod_ip.empty());
    EXPECT_TRUE(pods[1].containers[0].ports.empty());

    EXPECT_TRUE(parse_pod_list(json::parse("{}")).empty());
}

TEST(PodPhaseTest, ParsesKnownPhases) {
    EXPECT_EQ(parse_pod_phase("Running"), PodPhase::Running);
    EXPECT_EQ(parse_pod_phase("Succeeded"), PodPhase::Succeeded);
    EXPECT_EQ(parse_pod_phase("CrashLoopBackOff"), PodPhase::Unknown);
    EXPECT_EQ(to_string(PodPhase::Failed), "Failed");
}

// Stands in for `kubectl proxy` in front of a cluster with a "linkerd" namespace.
class RestKubernetesApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/version", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"major": "1", "minor": "28", "gitVersion": "v1.28.1"})", "application/json");
        });
        server_.Get("/api/v1/namespaces/linkerd", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"kind": "Namespace", "metadata": {"name": "linkerd"}})", "application/json");
        });
        server_.Get("/api/v1/namespaces/linkerd/pods", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(POD_LIST, "application/json");
        });
        server_.Get("/api/v1/namespaces/forbidden", [](const httplib::Request&, httplib::Response& res) {
            res.status = 403;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void TearDown() override {
        server_.stop();
        thread_.join();
    }

    RestKubernetesApi api() const { return RestKubernetesApi(fmt::format("http://127.0.0.1:{}", port_), 5s); }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

TEST_F(RestKubernetesApiTest, QueriesVersion) {
    auto version = api().get_version_info();
    EXPECT_EQ(version.major, 1);
    EXPECT_EQ(version.minor, 28);
}

TEST_F(RestKubernetesApiTest, ReportsNamespaceExistence) {
    auto client = api();
    EXPECT_TRUE(client.namespace_exists("linkerd"));
    EXPECT_FALSE(client.namespace_exists("missing"));
    EXPECT_NO_THROW(client.check_namespace_exists("linkerd"));
    EXPECT_THROW(client.check_namespace_exists("missing"), std::runtime_error);
    EXPECT_THROW(client.namespace_exists("forbidden"), std::runtime_error);
}

TEST_F(RestKubernetesApiTest, ListsPods) {
    auto pods = api().list_pods("linkerd");
    ASSERT_EQ(pods.size(), 2);
    EXPECT_EQ(pods[0].name, "linkerd-controller-7b9f");
}

TEST_F(RestKubernetesApiTest, ErrorStatusOnListThrows) {
    EXPECT_THROW(api().list_pods("missing"), std::runtime_error);
}

TEST(RestKubernetesApiUnreachableTest, TransportFailureThrows) {
    RestKubernetesApi client("http://127.0.0.1:1", 500ms);
    EXPECT_THROW(client.get_version_info(), std::runtime_error);
}

}  // namespace
