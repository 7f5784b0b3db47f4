// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <httplib.h>

#include <tt-logger/tt-logger.hpp>

#include <k8s/rest_kubernetes_api.hpp>

using json = nlohmann::json;

namespace meshdiag::k8s {

namespace {

// Managed clusters report minor versions such as "27+".
int parse_version_component(const std::string& value, const char* field) {
    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        digits++;
    }
    if (digits == 0) {
        throw std::runtime_error(fmt::format("invalid Kubernetes {} version '{}'", field, value));
    }
    return std::stoi(value.substr(0, digits));
}

ContainerDescriptor parse_container(const json& j) {
    ContainerDescriptor container;
    container.name = j.value("name", "");
    if (j.contains("ports")) {
        for (const auto& p : j.at("ports")) {
            ContainerPort port;
            port.name = p.value("name", "");
            port.container_port = p.value("containerPort", static_cast<uint16_t>(0));
            container.ports.push_back(std::move(port));
        }
    }
    return container;
}

}  // namespace

std::string namespace_path(const std::string& namespace_name, const std::string& extra) {
    if (!extra.empty() && extra.front() != '/') {
        throw std::invalid_argument(fmt::format("Path must start with a [/], was [{}]", extra));
    }
    return fmt::format("/api/v1/namespaces/{}{}", namespace_name, extra);
}

KubernetesVersion parse_version_info(const json& j) {
    KubernetesVersion version;
    version.major = parse_version_component(j.at("major").get<std::string>(), "major");
    version.minor = parse_version_component(j.at("minor").get<std::string>(), "minor");
    version.git_version = j.value("gitVersion", "");
    return version;
}

std::vector<PodDescriptor> parse_pod_list(const json& j) {
    std::vector<PodDescriptor> pods;
    if (!j.contains("items")) {
        return pods;
    }

    for (const auto& item : j.at("items")) {
        PodDescriptor pod;
        const auto& metadata = item.at("metadata");
        pod.name = metadata.value("name", "");
        pod.namespace_name = metadata.value("namespace", "");
        if (item.contains("status")) {
            const auto& status = item.at("status");
            pod.phase = parse_pod_phase(status.value("phase", ""));
            pod.pod_ip = status.value("podIP", "");
        }
        if (item.contains("spec") && item.at("spec").contains("containers")) {
            for (const auto& c : item.at("spec").at("containers")) {
                pod.containers.push_back(parse_container(c));
            }
        }
        pods.push_back(std::move(pod));
    }
    return pods;
}

RestKubernetesApi::RestKubernetesApi(std::string api_url, std::chrono::milliseconds timeout) :
    api_url_(std::move(api_url)), timeout_(timeout) {}

std::pair<int, std::string> RestKubernetesApi::get(const std::string& path) const {
    httplib::Client client(api_url_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);

    log_debug(tt::LogAlways, "[KubernetesApi] GET {}{}", api_url_, path);
    auto res = client.Get(path);
    if (!res) {
        throw std::runtime_error(
            fmt::format("error connecting to the Kubernetes API at {}: {}", api_url_, httplib::to_string(res.error())));
    }
    return {res->status, res->body};
}

json RestKubernetesApi::get_json(const std::string& path) const {
    auto [status, body] = get(path);
    if (status < 200 || status >= 300) {
        throw std::runtime_error(fmt::format("Kubernetes API returned HTTP {} for {}", status, path));
    }
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("malformed Kubernetes API response for {}: {}", path, e.what()));
    }
}

KubernetesVersion RestKubernetesApi::get_version_info() { return parse_version_info(get_json("/version")); }

void RestKubernetesApi::check_namespace_exists(const std::string& namespace_name) {
    if (!namespace_exists(namespace_name)) {
        throw std::runtime_error(fmt::format("The \"{}\" namespace does not exist", namespace_name));
    }
}

bool RestKubernetesApi::namespace_exists(const std::string& namespace_name) {
    const std::string path = namespace_path(namespace_name);
    auto [status, body] = get(path);
    if (status == 404) {
        return false;
    }
    if (status < 200 || status >= 300) {
        throw std::runtime_error(fmt::format("Kubernetes API returned HTTP {} for {}", status, path));
    }
    return true;
}

std::vector<PodDescriptor> RestKubernetesApi::list_pods(const std::string& namespace_name) {
    return parse_pod_list(get_json(namespace_path(namespace_name, "/pods")));
}

}  // namespace meshdiag::k8s
