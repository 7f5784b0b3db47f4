// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <k8s/pod.hpp>

namespace meshdiag::metrics {

// A connection to one container port, scoped to a single fetch.
class Tunnel {
public:
    virtual ~Tunnel() = default;

    // Establishes the tunnel and returns its base URL, e.g. "http://127.0.0.1:43211". Throws on
    // failure.
    virtual std::string open() = 0;

    // Releases the tunnel. Must be idempotent and safe to call after open() failed partway.
    virtual void close() = 0;
};

class TunnelProvider {
public:
    virtual ~TunnelProvider() = default;

    // Prepares, without connecting, a tunnel to the port named `port_name` of `container`.
    // `emit_logs` surfaces the transport's own diagnostics. Called concurrently from many threads.
    virtual std::unique_ptr<Tunnel> create(
        const k8s::PodDescriptor& pod,
        const k8s::ContainerDescriptor& container,
        const std::string& port_name,
        bool emit_logs) = 0;
};

}  // namespace meshdiag::metrics
