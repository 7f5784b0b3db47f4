// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * main.cpp
 * meshdiag command line tool.
 *
 *   meshdiag check [--pre | --proxy] [--wait 5m] [--expected-version stable-2.3.0]
 *   meshdiag metrics [--namespace linkerd] [--port linkerd-admin] [--timeout 30s]
 *
 * The Kubernetes API is reached through an endpoint that handles authentication itself, for
 * example `kubectl proxy` on http://127.0.0.1:8001.
 */

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <tt-logger/tt-logger.hpp>

#include <api/grpc_public_api_client.hpp>
#include <config/options.hpp>
#include <healthcheck/categories.hpp>
#include <healthcheck/retry_driver.hpp>
#include <k8s/rest_kubernetes_api.hpp>
#include <metrics/direct_tunnel.hpp>
#include <metrics/metrics_collector.hpp>

using namespace meshdiag;

static constexpr size_t LINE_WIDTH = 80;
static constexpr const char* OK_STATUS = "[ok]";
static constexpr const char* WARN_STATUS = "[warn]";
static constexpr const char* RETRY_STATUS = "[retry]";
static constexpr const char* FAIL_STATUS = "[FAIL]";

static void print_check_result(const healthcheck::CheckResult& result) {
    const std::string label = fmt::format("{}: {}", result.category, result.description);
    const size_t used = label.size() + std::string_view(OK_STATUS).size() + 1;
    const std::string filler(used < LINE_WIDTH ? LINE_WIDTH - used : 0, '.');

    if (result.passed()) {
        fmt::print("{}{}{}\n", label, filler, OK_STATUS);
        return;
    }
    const char* status = result.retry ? RETRY_STATUS : (result.warning ? WARN_STATUS : FAIL_STATUS);
    fmt::print("{}{}{} -- {}\n", label, filler, status, *result.error);
}

static int run_check(const config::Options& options, bool pre_install_only, bool data_plane_only) {
    using healthcheck::CategoryId;
    std::vector<CategoryId> categories = {CategoryId::KubernetesApi, CategoryId::KubernetesVersion};
    if (data_plane_only) {
        categories.push_back(CategoryId::DataPlane);
    } else if (pre_install_only) {
        categories.push_back(CategoryId::PreInstall);
    } else {
        categories.push_back(CategoryId::ControlPlaneExistence);
        categories.push_back(CategoryId::ControlPlaneApi);
    }
    categories.push_back(CategoryId::MeshVersion);

    config::HealthCheckOptions check_options = options.check;
    if (pre_install_only || data_plane_only) {
        // No public API client exists in these modes.
        check_options.should_check_control_plane_version = false;
    }

    healthcheck::HealthCheckCollaborators collaborators;
    collaborators.kubernetes_api_factory =
        [timeout = check_options.request_timeout](const std::string& api_url) -> std::shared_ptr<k8s::KubernetesApi> {
        return std::make_shared<k8s::RestKubernetesApi>(api_url, timeout);
    };
    collaborators.public_api_client_factory = api::make_grpc_public_api_client;

    healthcheck::MeshHealthChecker checker(categories, check_options, std::move(collaborators));

    bool success = false;
    if (check_options.should_retry) {
        const auto deadline = std::chrono::steady_clock::now() + check_options.retry_deadline;
        success = healthcheck::run_checks_with_retry(
            [&checker](const healthcheck::CheckObserver& observer) { return checker.run_checks(observer); },
            print_check_result,
            deadline,
            check_options.retry_interval);
    } else {
        success = checker.run_checks(print_check_result);
    }

    fmt::print("\nStatus check results are {}\n", success ? OK_STATUS : FAIL_STATUS);
    return success ? 0 : 2;
}

static int run_metrics(const config::Options& options) {
    k8s::RestKubernetesApi kubernetes_api(options.check.kubernetes_api_url, options.check.request_timeout);
    std::vector<k8s::PodDescriptor> pods = kubernetes_api.list_pods(options.metrics.namespace_name);

    metrics::MetricsCollector collector(std::make_shared<metrics::DirectTunnelProvider>());
    auto results = collector.collect(pods, options.metrics.port_name, options.metrics.timeout, options.metrics.emit_logs);

    int failures = 0;
    for (const auto& result : results) {
        fmt::print("#\n# POD {} (container {})\n#\n", result.pod, result.container);
        if (result.ok()) {
            fmt::print("{}\n", *result.metrics);
        } else {
            failures++;
            fmt::print("# ERROR {}\n", *result.error);
        }
    }
    const int exit_code = failures == 0 ? 0 : 1;

    // Fetches abandoned at the timeout keep running on detached threads; leave without running
    // static destructors underneath them.
    if (results.size() < metrics::count_eligible_containers(pods, options.metrics.port_name)) {
        std::fflush(stdout);
        std::cout.flush();
        std::quick_exit(exit_code);
    }
    return exit_code;
}

int main(int argc, char** argv) {
    cxxopts::Options cli("meshdiag", "Service mesh control plane diagnostics");
    cli.add_options()("command", "check or metrics", cxxopts::value<std::string>())(
        "c,config", "YAML options file", cxxopts::value<std::string>())(
        "l,linkerd-namespace", "Namespace of the control plane", cxxopts::value<std::string>())(
        "kubernetes-api", "Kubernetes API endpoint, e.g. a kubectl proxy", cxxopts::value<std::string>())(
        "api-addr", "Override the control plane public API address", cxxopts::value<std::string>())(
        "expected-version",
        "Overrides the version used when checking if the mesh is running the latest version",
        cxxopts::value<std::string>())(
        "pre", "Only run pre-installation checks", cxxopts::value<bool>()->default_value("false"))(
        "proxy", "Only run data-plane checks", cxxopts::value<bool>()->default_value("false"))(
        "wait",
        "Retry and wait up to this long (e.g. 5m) for checks asking to be retried",
        cxxopts::value<std::string>())(
        "n,namespace", "Namespace of the pods to scrape metrics from", cxxopts::value<std::string>())(
        "port", "Named container port serving /metrics", cxxopts::value<std::string>())(
        "timeout", "Deadline for the whole metrics batch (e.g. 30s)", cxxopts::value<std::string>())(
        "emit-logs", "Surface tunnel diagnostics", cxxopts::value<bool>()->default_value("false"))(
        "h,help", "Print usage");
    cli.parse_positional({"command"});

    try {
        auto result = cli.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << cli.help() << std::endl;
            return result.count("help") ? 0 : 1;
        }

        config::Options options;
        if (result.count("config")) {
            options = config::load_options(result["config"].as<std::string>());
        }
        if (result.count("linkerd-namespace")) {
            options.check.control_plane_namespace = result["linkerd-namespace"].as<std::string>();
        }
        if (result.count("kubernetes-api")) {
            options.check.kubernetes_api_url = result["kubernetes-api"].as<std::string>();
        }
        if (result.count("api-addr")) {
            options.check.api_addr = result["api-addr"].as<std::string>();
        }
        if (result.count("expected-version")) {
            options.check.expected_version = result["expected-version"].as<std::string>();
        }
        if (result.count("wait")) {
            options.check.should_retry = true;
            options.check.retry_deadline = config::parse_duration(result["wait"].as<std::string>());
        }
        if (result.count("namespace")) {
            options.metrics.namespace_name = result["namespace"].as<std::string>();
        }
        if (result.count("port")) {
            options.metrics.port_name = result["port"].as<std::string>();
        }
        if (result.count("timeout")) {
            options.metrics.timeout = config::parse_duration(result["timeout"].as<std::string>());
        }
        if (result["emit-logs"].as<bool>()) {
            options.metrics.emit_logs = true;
        }

        const std::string command = result["command"].as<std::string>();
        if (command == "check") {
            return run_check(options, result["pre"].as<bool>(), result["proxy"].as<bool>());
        }
        if (command == "metrics") {
            return run_metrics(options);
        }
        log_error(tt::LogAlways, "Unknown command '{}', expected check or metrics", command);
        return 1;
    } catch (const cxxopts::exceptions::exception& e) {
        log_error(tt::LogAlways, "{}", e.what());
        std::cout << cli.help() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        log_error(tt::LogAlways, "{}", e.what());
        return 1;
    }
}
