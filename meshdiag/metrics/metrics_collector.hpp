// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <k8s/pod.hpp>
#include <metrics/tunnel.hpp>

namespace meshdiag::metrics {

// Scrape outcome of one container. Exactly one of `metrics` and `error` is set.
struct MetricsResult {
    std::string pod;
    std::string container;
    std::optional<std::string> metrics;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// Orders by (pod, container).
bool operator<(const MetricsResult& a, const MetricsResult& b);

/*
 * Scrapes "/metrics" from every container of a set of pods that exposes a given named port. Each
 * container is fetched on its own thread through a tunnel from the TunnelProvider; the batch is
 * bounded by one wall-clock timeout. A failing container yields a result carrying the error and
 * never affects its siblings. Fetches still running at the timeout are abandoned and their
 * results dropped.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::shared_ptr<TunnelProvider> tunnel_provider);

    // Returns the results that arrived within `timeout`, sorted by (pod, container). Pods that are
    // not running are skipped.
    std::vector<MetricsResult> collect(
        const std::vector<k8s::PodDescriptor>& pods,
        const std::string& port_name,
        std::chrono::milliseconds timeout,
        bool emit_logs) const;

private:
    std::shared_ptr<TunnelProvider> tunnel_provider_;
};

// Containers of `pod` exposing a port named `port_name`. Empty for pods that are not running.
std::vector<k8s::ContainerDescriptor> containers_with_port(const k8s::PodDescriptor& pod, const std::string& port_name);

// Number of fetches collect() dispatches for `pods`.
size_t count_eligible_containers(const std::vector<k8s::PodDescriptor>& pods, const std::string& port_name);

// GET <base_url>/metrics. Throws std::runtime_error on transport failure or a non-2xx status.
std::string fetch_metrics(const std::string& base_url, std::chrono::milliseconds timeout);

// Opens a tunnel to `container`, fetches its metrics and releases the tunnel on every path.
MetricsResult fetch_container_metrics(
    TunnelProvider& tunnel_provider,
    const k8s::PodDescriptor& pod,
    const k8s::ContainerDescriptor& container,
    const std::string& port_name,
    bool emit_logs,
    std::chrono::milliseconds timeout);

}  // namespace meshdiag::metrics
