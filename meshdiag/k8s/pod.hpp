// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace meshdiag::k8s {

enum class PodPhase { Pending, Running, Succeeded, Failed, Unknown };

struct ContainerPort {
    std::string name;
    uint16_t container_port = 0;
};

struct ContainerDescriptor {
    std::string name;
    std::vector<ContainerPort> ports;

    // Returns the port named `port_name`, or nullptr.
    const ContainerPort* find_port(std::string_view port_name) const;
};

struct PodDescriptor {
    std::string name;
    std::string namespace_name;
    PodPhase phase = PodPhase::Unknown;
    std::string pod_ip;
    std::vector<ContainerDescriptor> containers;

    bool running() const { return phase == PodPhase::Running; }
};

// Kubernetes spells phases "Running", "Pending", ... Anything else maps to Unknown.
PodPhase parse_pod_phase(std::string_view phase);
std::string_view to_string(PodPhase phase);

}  // namespace meshdiag::k8s
