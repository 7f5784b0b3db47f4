// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>

#include <config/options.hpp>

namespace meshdiag::config {

namespace {

template <typename T>
void read_if_present(const YAML::Node& node, const char* key, T& out) {
    if (node[key].IsDefined()) {
        out = node[key].as<T>();
    }
}

void read_duration_if_present(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
    if (node[key].IsDefined()) {
        out = parse_duration(node[key].as<std::string>());
    }
}

}  // namespace

std::chrono::milliseconds parse_duration(const std::string& text) {
    size_t unit_start = 0;
    while (unit_start < text.size() && std::isdigit(static_cast<unsigned char>(text[unit_start]))) {
        unit_start++;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + unit_start, value);
    if (unit_start == 0 || ec != std::errc()) {
        throw std::runtime_error(fmt::format("invalid duration '{}'", text));
    }

    const std::string unit = text.substr(unit_start);
    uint64_t ms_per_unit = 0;
    if (unit == "ms") {
        ms_per_unit = 1;
    } else if (unit == "s") {
        ms_per_unit = 1000;
    } else if (unit == "m") {
        ms_per_unit = 60 * 1000;
    } else if (unit == "h") {
        ms_per_unit = 60 * 60 * 1000;
    } else {
        throw std::runtime_error(fmt::format("invalid duration unit in '{}', expected ms, s, m or h", text));
    }

    const auto max_ms = static_cast<uint64_t>(std::chrono::milliseconds::max().count());
    if (value > max_ms / ms_per_unit) {
        throw std::runtime_error(fmt::format("invalid duration '{}', value out of range", text));
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value * ms_per_unit));
}

Options parse_options(const YAML::Node& yaml) {
    Options options;
    if (!yaml.IsDefined() || yaml.IsNull()) {
        return options;
    }
    MESHDIAG_FATAL(yaml.IsMap(), "Options: Expecting yaml to be a Map");

    if (const auto& check = yaml["check"]; check.IsDefined()) {
        MESHDIAG_FATAL(check.IsMap(), "Options: Expecting 'check' to be a Map");
        auto& o = options.check;
        read_if_present(check, "control_plane_namespace", o.control_plane_namespace);
        read_if_present(check, "data_plane_namespace", o.data_plane_namespace);
        read_if_present(check, "kubernetes_api_url", o.kubernetes_api_url);
        read_if_present(check, "api_addr", o.api_addr);
        read_if_present(check, "expected_version", o.expected_version);
        read_if_present(check, "version_check_url", o.version_check_url);
        read_if_present(check, "wait", o.should_retry);
        read_duration_if_present(check, "retry_deadline", o.retry_deadline);
        read_duration_if_present(check, "retry_interval", o.retry_interval);
        read_duration_if_present(check, "self_check_timeout", o.self_check_timeout);
        read_duration_if_present(check, "request_timeout", o.request_timeout);
        read_if_present(check, "check_kube_version", o.should_check_kube_version);
        read_if_present(check, "check_control_plane_version", o.should_check_control_plane_version);
    }

    if (const auto& metrics = yaml["metrics"]; metrics.IsDefined()) {
        MESHDIAG_FATAL(metrics.IsMap(), "Options: Expecting 'metrics' to be a Map");
        auto& o = options.metrics;
        read_if_present(metrics, "namespace", o.namespace_name);
        read_if_present(metrics, "port", o.port_name);
        read_duration_if_present(metrics, "timeout", o.timeout);
        read_if_present(metrics, "emit_logs", o.emit_logs);
    }

    MESHDIAG_FATAL(
        options.check.retry_interval.count() > 0, "Options: retry_interval must be positive");
    MESHDIAG_FATAL(!options.metrics.port_name.empty(), "Options: metrics port must not be empty");
    return options;
}

Options load_options(const std::string& path) {
    std::ifstream file(path);
    MESHDIAG_FATAL(not file.fail(), "Failed to open file: {}", path);

    log_debug(tt::LogAlways, "[Options] Loading {}", path);
    return parse_options(YAML::LoadFile(path));
}

}  // namespace meshdiag::config
