// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <tuple>

#include <fmt/format.h>
#include <httplib.h>

#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>
#include <meshdiag_stl/cleanup.hpp>

#include <metrics/metrics_collector.hpp>
#include <utils/result_funnel.hpp>

namespace meshdiag::metrics {

static constexpr const char* METRICS_PATH = "/metrics";

bool operator<(const MetricsResult& a, const MetricsResult& b) {
    return std::tie(a.pod, a.container) < std::tie(b.pod, b.container);
}

std::vector<k8s::ContainerDescriptor> containers_with_port(
    const k8s::PodDescriptor& pod, const std::string& port_name) {
    std::vector<k8s::ContainerDescriptor> containers;
    if (!pod.running()) {
        return containers;
    }
    for (const auto& container : pod.containers) {
        if (container.find_port(port_name) != nullptr) {
            containers.push_back(container);
        }
    }
    return containers;
}

size_t count_eligible_containers(const std::vector<k8s::PodDescriptor>& pods, const std::string& port_name) {
    size_t count = 0;
    for (const auto& pod : pods) {
        count += containers_with_port(pod, port_name).size();
    }
    return count;
}

std::string fetch_metrics(const std::string& base_url, std::chrono::milliseconds timeout) {
    httplib::Client client(base_url);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);

    auto res = client.Get(METRICS_PATH);
    if (!res) {
        throw std::runtime_error(
            fmt::format("GET {}{} failed: {}", base_url, METRICS_PATH, httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error(fmt::format("GET {}{} returned HTTP {}", base_url, METRICS_PATH, res->status));
    }
    return std::move(res->body);
}

MetricsResult fetch_container_metrics(
    TunnelProvider& tunnel_provider,
    const k8s::PodDescriptor& pod,
    const k8s::ContainerDescriptor& container,
    const std::string& port_name,
    bool emit_logs,
    std::chrono::milliseconds timeout) {
    MetricsResult result{.pod = pod.name, .container = container.name};
    try {
        std::unique_ptr<Tunnel> tunnel = tunnel_provider.create(pod, container, port_name, emit_logs);
        if (!tunnel) {
            throw std::runtime_error("tunnel provider returned no tunnel");
        }
        auto release = meshdiag::stl::make_cleanup([&tunnel, &pod, &container]() {
            try {
                tunnel->close();
            } catch (const std::exception& e) {
                log_warning(
                    tt::LogAlways,
                    "[MetricsCollector] Failed to close tunnel to {}/{}: {}",
                    pod.name,
                    container.name,
                    e.what());
            } catch (...) {
                log_warning(
                    tt::LogAlways, "[MetricsCollector] Failed to close tunnel to {}/{}", pod.name, container.name);
            }
        });

        const std::string address = tunnel->open();
        result.metrics = fetch_metrics(address, timeout);
    } catch (const std::exception& e) {
        result.metrics.reset();
        result.error = e.what();
    } catch (...) {
        result.metrics.reset();
        result.error = "unknown error";
    }
    if (result.error) {
        log_debug(
            tt::LogAlways,
            "[MetricsCollector] Failed to fetch metrics from {}/{}: {}",
            pod.name,
            container.name,
            *result.error);
    }
    return result;
}

MetricsCollector::MetricsCollector(std::shared_ptr<TunnelProvider> tunnel_provider) :
    tunnel_provider_(std::move(tunnel_provider)) {
    MESHDIAG_FATAL(tunnel_provider_ != nullptr, "MetricsCollector requires a tunnel provider");
}

std::vector<MetricsResult> MetricsCollector::collect(
    const std::vector<k8s::PodDescriptor>& pods,
    const std::string& port_name,
    std::chrono::milliseconds timeout,
    bool emit_logs) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // Eligibility is settled before dispatch so the funnel knows how many results to expect.
    std::vector<std::pair<const k8s::PodDescriptor*, k8s::ContainerDescriptor>> eligible;
    for (const auto& pod : pods) {
        if (!pod.running()) {
            log_info(tt::LogAlways, "[MetricsCollector] Pod not running: {}", pod.name);
            continue;
        }
        for (auto& container : containers_with_port(pod, port_name)) {
            eligible.emplace_back(&pod, std::move(container));
        }
    }

    auto funnel = std::make_shared<ResultFunnel<MetricsResult>>(eligible.size());
    if (eligible.empty()) {
        log_debug(tt::LogAlways, "[MetricsCollector] No containers expose port {}", port_name);
        return {};
    }

    for (auto& [pod, container] : eligible) {
        // Workers own copies of everything they touch, they may outlive this call.
        try {
            std::thread(
                [provider = tunnel_provider_,
                 funnel,
                 pod = *pod,
                 container = container,
                 port_name,
                 emit_logs,
                 timeout]() {
                    MetricsResult result =
                        fetch_container_metrics(*provider, pod, container, port_name, emit_logs, timeout);
                    if (!funnel->push(std::move(result))) {
                        log_debug(
                            tt::LogAlways,
                            "[MetricsCollector] Discarding late result from {}/{}",
                            pod.name,
                            container.name);
                    }
                })
                .detach();
        } catch (const std::system_error& e) {
            log_error(tt::LogAlways, "[MetricsCollector] Could not start fetch for {}: {}", pod->name, e.what());
            funnel->push(MetricsResult{
                .pod = pod->name,
                .container = container.name,
                .metrics = std::nullopt,
                .error = fmt::format("could not start fetch: {}", e.what()),
            });
        }
    }

    std::vector<MetricsResult> results = funnel->drain_until(deadline);
    if (results.size() < eligible.size()) {
        log_warning(
            tt::LogAlways,
            "[MetricsCollector] Timed out after {} ms, {} of {} fetches completed",
            timeout.count(),
            results.size(),
            eligible.size());
    }

    std::sort(results.begin(), results.end());
    return results;
}

}  // namespace meshdiag::metrics
