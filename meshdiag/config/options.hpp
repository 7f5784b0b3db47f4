// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace YAML {
class Node;
}

namespace meshdiag::config {

struct HealthCheckOptions {
    std::string control_plane_namespace = "linkerd";
    std::string data_plane_namespace = "default";
    // API server endpoint that handles authentication itself, e.g. `kubectl proxy`.
    std::string kubernetes_api_url = "http://127.0.0.1:8001";
    // Overrides the in-cluster address of the control plane public API.
    std::string api_addr;
    // Overrides the latest release looked up from version_check_url.
    std::string expected_version;
    std::string version_check_url = "https://versioncheck.linkerd.io/version.json";

    // Re-run the checks while any failure asks to be retried, until retry_deadline elapses.
    bool should_retry = false;
    std::chrono::milliseconds retry_deadline = std::chrono::minutes(5);
    std::chrono::milliseconds retry_interval = std::chrono::seconds(1);

    std::chrono::milliseconds self_check_timeout = std::chrono::seconds(5);
    std::chrono::milliseconds request_timeout = std::chrono::seconds(10);

    bool should_check_kube_version = true;
    bool should_check_control_plane_version = true;
};

struct MetricsOptions {
    std::string namespace_name = "linkerd";
    std::string port_name = "linkerd-admin";
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
    bool emit_logs = false;
};

struct Options {
    HealthCheckOptions check;
    MetricsOptions metrics;
};

// Parses "250ms", "5s", "2m" or "1h". Throws std::runtime_error on anything else.
std::chrono::milliseconds parse_duration(const std::string& text);

/*
 * Reads options from YAML. Missing keys keep their defaults:
 *
 *   check:
 *     control_plane_namespace: linkerd
 *     kubernetes_api_url: http://127.0.0.1:8001
 *     wait: true
 *     retry_deadline: 5m
 *   metrics:
 *     port: linkerd-admin
 *     timeout: 30s
 */
Options parse_options(const YAML::Node& yaml);
Options load_options(const std::string& path);

}  // namespace meshdiag::config
