// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <k8s/pod.hpp>

namespace meshdiag::k8s {

struct KubernetesVersion {
    int major = 0;
    int minor = 0;
    std::string git_version;
};

/*
 * The subset of the Kubernetes API used by the health checks and the metrics commands. Every
 * method throws std::runtime_error when the server cannot be reached or answers with an error.
 */
class KubernetesApi {
public:
    virtual ~KubernetesApi() = default;

    virtual KubernetesVersion get_version_info() = 0;

    // Throws if the namespace does not exist.
    virtual void check_namespace_exists(const std::string& namespace_name) = 0;

    virtual bool namespace_exists(const std::string& namespace_name) = 0;

    virtual std::vector<PodDescriptor> list_pods(const std::string& namespace_name) = 0;
};

// Builds a client for the API server at `api_url`. Construction must not contact the server.
using KubernetesApiFactory = std::function<std::shared_ptr<KubernetesApi>(const std::string& api_url)>;

}  // namespace meshdiag::k8s
