// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <k8s/pod.hpp>

namespace meshdiag::k8s {

const ContainerPort* ContainerDescriptor::find_port(std::string_view port_name) const {
    for (const auto& port : ports) {
        if (port.name == port_name) {
            return &port;
        }
    }
    return nullptr;
}

PodPhase parse_pod_phase(std::string_view phase) {
    if (phase == "Pending") {
        return PodPhase::Pending;
    }
    if (phase == "Running") {
        return PodPhase::Running;
    }
    if (phase == "Succeeded") {
        return PodPhase::Succeeded;
    }
    if (phase == "Failed") {
        return PodPhase::Failed;
    }
    return PodPhase::Unknown;
}

std::string_view to_string(PodPhase phase) {
    switch (phase) {
        case PodPhase::Pending: return "Pending";
        case PodPhase::Running: return "Running";
        case PodPhase::Succeeded: return "Succeeded";
        case PodPhase::Failed: return "Failed";
        case PodPhase::Unknown: return "Unknown";
    }
    return "Unknown";
}

}  // namespace meshdiag::k8s
