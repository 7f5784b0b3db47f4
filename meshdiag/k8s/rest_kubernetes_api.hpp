// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
 * rest_kubernetes_api.hpp
 *
 * KubernetesApi over plain HTTP. The endpoint must already take care of authentication, as
 * `kubectl proxy` does; no kubeconfig or credential handling happens here.
 */

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <k8s/kubernetes_api.hpp>

namespace meshdiag::k8s {

class RestKubernetesApi : public KubernetesApi {
public:
    explicit RestKubernetesApi(std::string api_url, std::chrono::milliseconds timeout = std::chrono::seconds(10));

    KubernetesVersion get_version_info() override;
    void check_namespace_exists(const std::string& namespace_name) override;
    bool namespace_exists(const std::string& namespace_name) override;
    std::vector<PodDescriptor> list_pods(const std::string& namespace_name) override;

    const std::string& api_url() const { return api_url_; }

private:
    // Returns the HTTP status and body of a GET on `path`. Throws on transport failure.
    std::pair<int, std::string> get(const std::string& path) const;
    nlohmann::json get_json(const std::string& path) const;

    std::string api_url_;
    std::chrono::milliseconds timeout_;
};

// "/api/v1/namespaces/<namespace><extra>". `extra` must be empty or start with '/'.
std::string namespace_path(const std::string& namespace_name, const std::string& extra = "");

KubernetesVersion parse_version_info(const nlohmann::json& j);
std::vector<PodDescriptor> parse_pod_list(const nlohmann::json& j);

}  // namespace meshdiag::k8s
