// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>

#include <fmt/format.h>

#include <tt-logger/tt-logger.hpp>

#include <metrics/direct_tunnel.hpp>

namespace meshdiag::metrics {

DirectTunnel::DirectTunnel(std::string pod_name, std::string pod_ip, uint16_t port, bool emit_logs) :
    pod_name_(std::move(pod_name)), pod_ip_(std::move(pod_ip)), port_(port), emit_logs_(emit_logs) {}

std::string DirectTunnel::open() {
    if (pod_ip_.empty()) {
        throw std::runtime_error(fmt::format("pod {} has no IP address", pod_name_));
    }
    if (port_ == 0) {
        throw std::runtime_error(fmt::format("pod {} exposes no usable port", pod_name_));
    }
    // IPv6 literals need brackets in a URL authority.
    const bool ipv6 = pod_ip_.find(':') != std::string::npos;
    std::string url = ipv6 ? fmt::format("http://[{}]:{}", pod_ip_, port_) : fmt::format("http://{}:{}", pod_ip_, port_);
    open_ = true;
    if (emit_logs_) {
        log_info(tt::LogAlways, "[DirectTunnel] {} reachable at {}", pod_name_, url);
    }
    return url;
}

void DirectTunnel::close() {
    if (open_.exchange(false) && emit_logs_) {
        log_info(tt::LogAlways, "[DirectTunnel] Released tunnel to {}", pod_name_);
    }
}

std::unique_ptr<Tunnel> DirectTunnelProvider::create(
    const k8s::PodDescriptor& pod,
    const k8s::ContainerDescriptor& container,
    const std::string& port_name,
    bool emit_logs) {
    const k8s::ContainerPort* port = container.find_port(port_name);
    return std::make_unique<DirectTunnel>(pod.name, pod.pod_ip, port ? port->container_port : 0, emit_logs);
}

}  // namespace meshdiag::metrics
