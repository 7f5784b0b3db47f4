// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
 * direct_tunnel.hpp
 *
 * TunnelProvider that reaches a container at its pod IP. Usable where pod IPs are routable, such
 * as from inside the cluster; no port-forwarding takes place.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <metrics/tunnel.hpp>

namespace meshdiag::metrics {

class DirectTunnel : public Tunnel {
public:
    DirectTunnel(std::string pod_name, std::string pod_ip, uint16_t port, bool emit_logs);

    std::string open() override;
    void close() override;

    bool is_open() const { return open_.load(); }

private:
    std::string pod_name_;
    std::string pod_ip_;
    uint16_t port_;
    bool emit_logs_;
    std::atomic<bool> open_{false};
};

class DirectTunnelProvider : public TunnelProvider {
public:
    std::unique_ptr<Tunnel> create(
        const k8s::PodDescriptor& pod,
        const k8s::ContainerDescriptor& container,
        const std::string& port_name,
        bool emit_logs) override;
};

}  // namespace meshdiag::metrics
