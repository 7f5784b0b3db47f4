// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>

#include <healthcheck/categories.hpp>

namespace meshdiag::healthcheck {

namespace {

bool is_meshed(const k8s::PodDescriptor& pod) {
    for (const auto& container : pod.containers) {
        if (container.name == PROXY_CONTAINER_NAME) {
            return true;
        }
    }
    return false;
}

// Pods that are not running yet are expected right after an install. `retryable` is set when the
// caller polls until the mesh settles.
void check_pods_running(const std::vector<k8s::PodDescriptor>& pods, bool retryable) {
    for (const auto& pod : pods) {
        if (!pod.running()) {
            throw CheckError(
                fmt::format("The \"{}\" pod is not running (phase {})", pod.name, k8s::to_string(pod.phase)),
                retryable);
        }
    }
}

}  // namespace

const char* category_name(CategoryId id) {
    switch (id) {
        case CategoryId::KubernetesApi: return KUBERNETES_API_CATEGORY;
        case CategoryId::KubernetesVersion: return KUBERNETES_VERSION_CATEGORY;
        case CategoryId::PreInstall: return PRE_INSTALL_CATEGORY;
        case CategoryId::ControlPlaneExistence: return CONTROL_PLANE_EXISTENCE_CATEGORY;
        case CategoryId::ControlPlaneApi: return CONTROL_PLANE_API_CATEGORY;
        case CategoryId::DataPlane: return DATA_PLANE_CATEGORY;
        case CategoryId::MeshVersion: return MESH_VERSION_CATEGORY;
    }
    return "unknown";
}

MeshHealthChecker::MeshHealthChecker(
    const std::vector<CategoryId>& categories,
    config::HealthCheckOptions options,
    HealthCheckCollaborators collaborators) :
    options_(std::move(options)), collaborators_(std::move(collaborators)) {
    for (CategoryId id : categories) {
        switch (id) {
            case CategoryId::KubernetesApi: add_kubernetes_api_checks(); break;
            case CategoryId::KubernetesVersion: add_kubernetes_version_checks(); break;
            case CategoryId::PreInstall: add_pre_install_checks(); break;
            case CategoryId::ControlPlaneExistence: add_control_plane_existence_checks(); break;
            case CategoryId::ControlPlaneApi: add_control_plane_api_checks(); break;
            case CategoryId::DataPlane: add_data_plane_checks(); break;
            case CategoryId::MeshVersion: add_mesh_version_checks(); break;
        }
    }
    log_debug(tt::LogAlways, "[MeshHealthChecker] Registered {} checks", checker_.size());
}

k8s::KubernetesApi& MeshHealthChecker::require_kubernetes_api() const {
    if (!kube_api_) {
        throw std::runtime_error("Kubernetes client is not initialized");
    }
    return *kube_api_;
}

api::PublicApiClient& MeshHealthChecker::require_public_api_client() const {
    if (!api_client_) {
        throw std::runtime_error("control plane API client is not initialized");
    }
    return *api_client_;
}

void MeshHealthChecker::add_kubernetes_api_checks() {
    MESHDIAG_FATAL(
        static_cast<bool>(collaborators_.kubernetes_api_factory),
        "{} checks require a Kubernetes API factory",
        KUBERNETES_API_CATEGORY);

    checker_.add(
        KUBERNETES_API_CATEGORY,
        "can initialize the client",
        [this] {
            kube_api_ = collaborators_.kubernetes_api_factory(options_.kubernetes_api_url);
            if (!kube_api_) {
                throw std::runtime_error(
                    fmt::format("could not create a Kubernetes client for {}", options_.kubernetes_api_url));
            }
        },
        /*fatal=*/true);

    checker_.add(
        KUBERNETES_API_CATEGORY,
        "can query the Kubernetes API",
        [this] { kube_version_ = require_kubernetes_api().get_version_info(); },
        /*fatal=*/true);
}

void MeshHealthChecker::add_kubernetes_version_checks() {
    if (!options_.should_check_kube_version) {
        return;
    }
    checker_.add(KUBERNETES_VERSION_CATEGORY, "is running the minimum Kubernetes API version", [this] {
        if (!kube_version_) {
            throw std::runtime_error("Kubernetes version is unknown");
        }
        check_minimum_kubernetes_version(*kube_version_);
    });
}

void MeshHealthChecker::add_pre_install_checks() {
    checker_.add(PRE_INSTALL_CATEGORY, "control plane namespace does not already exist", [this] {
        if (require_kubernetes_api().namespace_exists(options_.control_plane_namespace)) {
            throw CheckError(fmt::format("The \"{}\" namespace already exists", options_.control_plane_namespace));
        }
    });
}

void MeshHealthChecker::add_control_plane_existence_checks() {
    checker_.add(
        CONTROL_PLANE_EXISTENCE_CATEGORY,
        "control plane namespace exists",
        [this] { require_kubernetes_api().check_namespace_exists(options_.control_plane_namespace); },
        /*fatal=*/true);

    checker_.add(
        CONTROL_PLANE_EXISTENCE_CATEGORY,
        "control plane pods are ready",
        [this] {
            auto pods = require_kubernetes_api().list_pods(options_.control_plane_namespace);
            if (pods.empty()) {
                throw CheckError(
                    fmt::format("No pods found in the \"{}\" namespace", options_.control_plane_namespace),
                    options_.should_retry);
            }
            check_pods_running(pods, options_.should_retry);
        },
        /*fatal=*/true);
}

void MeshHealthChecker::add_control_plane_api_checks() {
    MESHDIAG_FATAL(
        static_cast<bool>(collaborators_.public_api_client_factory),
        "{} checks require a public API client factory",
        CONTROL_PLANE_API_CATEGORY);

    checker_.add(
        CONTROL_PLANE_API_CATEGORY,
        "can initialize the client",
        [this] {
            api_client_ =
                collaborators_.public_api_client_factory(options_.control_plane_namespace, options_.api_addr);
            if (!api_client_) {
                throw std::runtime_error("could not create a control plane API client");
            }
        },
        /*fatal=*/true);

    checker_.add_rpc(
        CONTROL_PLANE_API_CATEGORY,
        "can query the control plane API",
        [this] {
            auto& client = require_public_api_client();
            try {
                return client.self_check(options_.self_check_timeout);
            } catch (const std::exception& e) {
                // The API is often briefly unavailable while the control plane starts.
                throw CheckError(e.what(), options_.should_retry);
            }
        },
        /*fatal=*/true);
}

void MeshHealthChecker::add_data_plane_checks() {
    checker_.add(
        DATA_PLANE_CATEGORY,
        "data plane namespace exists",
        [this] { require_kubernetes_api().check_namespace_exists(options_.data_plane_namespace); },
        /*fatal=*/true);

    checker_.add(DATA_PLANE_CATEGORY, "data plane proxies are ready", [this] {
        std::vector<k8s::PodDescriptor> meshed;
        for (auto& pod : require_kubernetes_api().list_pods(options_.data_plane_namespace)) {
            if (is_meshed(pod)) {
                meshed.push_back(std::move(pod));
            }
        }
        if (meshed.empty()) {
            throw CheckError(fmt::format("No meshed pods found in the \"{}\" namespace", options_.data_plane_namespace));
        }
        check_pods_running(meshed, options_.should_retry);
    });
}

void MeshHealthChecker::add_mesh_version_checks() {
    checker_.add(
        MESH_VERSION_CATEGORY,
        "can determine the latest version",
        [this] {
            if (!options_.expected_version.empty()) {
                latest_channels_ = Channels::pinned(options_.expected_version);
            } else if (collaborators_.latest_version_source) {
                latest_channels_ = collaborators_.latest_version_source();
            } else {
                latest_channels_ = fetch_latest_channels(options_.version_check_url, options_.request_timeout);
            }
        },
        /*fatal=*/true);

    checker_.add_warning(MESH_VERSION_CATEGORY, "cli is up-to-date", [this] {
        check_up_to_date("cli", collaborators_.client_version, latest_channels_.value());
    });

    if (!options_.should_check_control_plane_version) {
        return;
    }
    checker_.add_warning(MESH_VERSION_CATEGORY, "control plane is up-to-date", [this] {
        const std::string server_version = require_public_api_client().server_version(options_.request_timeout);
        check_up_to_date("control plane", server_version, latest_channels_.value());
    });
}

}  // namespace meshdiag::healthcheck
