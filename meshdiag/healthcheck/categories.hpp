// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
 * categories.hpp
 *
 * The standard check categories of the mesh diagnostics. MeshHealthChecker wires them into a
 * HealthChecker in the order given by the caller. Categories depend on one another through state
 * established by earlier checks:
 *
 *   KubernetesApi          creates the Kubernetes client, required by every other category
 *   KubernetesVersion      needs the version read by KubernetesApi
 *   PreInstall             control plane is not yet installed
 *   ControlPlaneExistence  control plane namespace and pods are there
 *   ControlPlaneApi        creates the public API client and runs the remote self-check
 *   DataPlane              meshed pods in the data plane namespace are running
 *   MeshVersion            cli and control plane are on the latest release, the latter
 *                          requires ControlPlaneApi
 */

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <api/public_api_client.hpp>
#include <config/options.hpp>
#include <healthcheck/health_checker.hpp>
#include <healthcheck/version.hpp>
#include <k8s/kubernetes_api.hpp>

namespace meshdiag::healthcheck {

enum class CategoryId {
    KubernetesApi,
    KubernetesVersion,
    PreInstall,
    ControlPlaneExistence,
    ControlPlaneApi,
    DataPlane,
    MeshVersion,
};

inline constexpr const char* KUBERNETES_API_CATEGORY = "kubernetes-api";
inline constexpr const char* KUBERNETES_VERSION_CATEGORY = "kubernetes-version";
inline constexpr const char* PRE_INSTALL_CATEGORY = "pre-install";
inline constexpr const char* CONTROL_PLANE_EXISTENCE_CATEGORY = "linkerd-existence";
inline constexpr const char* CONTROL_PLANE_API_CATEGORY = "linkerd-api";
inline constexpr const char* DATA_PLANE_CATEGORY = "linkerd-data-plane";
inline constexpr const char* MESH_VERSION_CATEGORY = "linkerd-version";

// Name of the sidecar container that marks a pod as meshed.
inline constexpr const char* PROXY_CONTAINER_NAME = "linkerd-proxy";

const char* category_name(CategoryId id);

struct HealthCheckCollaborators {
    k8s::KubernetesApiFactory kubernetes_api_factory;
    api::PublicApiClientFactory public_api_client_factory;
    // Source of the latest releases. When unset, they are fetched from the version check URL.
    std::function<Channels()> latest_version_source;
    std::string client_version = healthcheck::client_version();
};

class MeshHealthChecker {
public:
    MeshHealthChecker(
        const std::vector<CategoryId>& categories,
        config::HealthCheckOptions options,
        HealthCheckCollaborators collaborators);

    // Checks capture `this`.
    MeshHealthChecker(const MeshHealthChecker&) = delete;
    MeshHealthChecker& operator=(const MeshHealthChecker&) = delete;
    MeshHealthChecker(MeshHealthChecker&&) = delete;
    MeshHealthChecker& operator=(MeshHealthChecker&&) = delete;

    bool run_checks(const CheckObserver& observer) const { return checker_.run_checks(observer); }

    const HealthChecker& checker() const { return checker_; }
    const config::HealthCheckOptions& options() const { return options_; }

    // Clients created by the KubernetesApi and ControlPlaneApi checks; null until those ran.
    std::shared_ptr<k8s::KubernetesApi> kubernetes_api() const { return kube_api_; }
    std::shared_ptr<api::PublicApiClient> public_api_client() const { return api_client_; }

private:
    void add_kubernetes_api_checks();
    void add_kubernetes_version_checks();
    void add_pre_install_checks();
    void add_control_plane_existence_checks();
    void add_control_plane_api_checks();
    void add_data_plane_checks();
    void add_mesh_version_checks();

    k8s::KubernetesApi& require_kubernetes_api() const;
    api::PublicApiClient& require_public_api_client() const;

    config::HealthCheckOptions options_;
    HealthCheckCollaborators collaborators_;
    HealthChecker checker_;

    std::shared_ptr<k8s::KubernetesApi> kube_api_;
    std::optional<k8s::KubernetesVersion> kube_version_;
    std::shared_ptr<api::PublicApiClient> api_client_;
    std::optional<Channels> latest_channels_;
};

}  // namespace meshdiag::healthcheck
