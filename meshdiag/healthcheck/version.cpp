// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <tt-logger/tt-logger.hpp>

#include <healthcheck/check.hpp>
#include <healthcheck/version.hpp>

#ifndef MESHDIAG_VERSION
#define MESHDIAG_VERSION "dev-undefined"
#endif

using json = nlohmann::json;

namespace meshdiag::healthcheck {

namespace {

// Splits "https://host:port/path?query" into ("https://host:port", "/path?query").
std::pair<std::string, std::string> split_url(const std::string& url) {
    const size_t scheme_end = url.find("://");
    const size_t path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

}  // namespace

std::optional<ChannelVersion> parse_channel_version(const std::string& release) {
    const size_t dash = release.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == release.size()) {
        return std::nullopt;
    }
    return ChannelVersion{release.substr(0, dash), release.substr(dash + 1)};
}

Channels Channels::from_json(const std::string& body) {
    std::map<std::string, std::string> releases;
    try {
        json j = json::parse(body);
        for (const auto& [key, value] : j.items()) {
            if (value.is_string()) {
                releases.emplace(key, value.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("malformed version check response: {}", e.what()));
    }
    if (releases.empty()) {
        throw std::runtime_error("version check response lists no releases");
    }
    return Channels(std::move(releases));
}

Channels Channels::pinned(const std::string& release) {
    auto parsed = parse_channel_version(release);
    if (!parsed) {
        throw CheckError(fmt::format("unsupported version format: {}", release));
    }
    return Channels(std::map<std::string, std::string>{{parsed->channel, release}});
}

std::string Channels::latest_for(const std::string& current) const {
    auto parsed = parse_channel_version(current);
    if (!parsed) {
        throw CheckError(fmt::format("unsupported version format: {}", current));
    }
    auto it = releases_.find(parsed->channel);
    if (it == releases_.end()) {
        throw CheckError(fmt::format("unsupported version channel: {}", parsed->channel));
    }
    return it->second;
}

const std::string& client_version() {
    static const std::string version = MESHDIAG_VERSION;
    return version;
}

Channels fetch_latest_channels(const std::string& url, std::chrono::milliseconds timeout) {
    auto [base, path] = split_url(url);
    httplib::Client client(base);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);

    log_debug(tt::LogAlways, "[Version] Fetching latest versions from {}", url);
    auto res = client.Get(path);
    if (!res) {
        throw std::runtime_error(fmt::format("failed to reach {}: {}", url, httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error(fmt::format("unexpected versioncheck response: HTTP {}", res->status));
    }
    return Channels::from_json(res->body);
}

void check_up_to_date(const std::string& who, const std::string& current, const Channels& latest) {
    const std::string latest_release = latest.latest_for(current);
    if (current == latest_release) {
        return;
    }
    auto current_parsed = parse_channel_version(current);
    auto latest_parsed = parse_channel_version(latest_release);
    throw CheckError(fmt::format(
        "{} is running version {} but the latest {} version is {}",
        who,
        current_parsed->version,
        current_parsed->channel,
        latest_parsed ? latest_parsed->version : latest_release));
}

void check_minimum_kubernetes_version(const k8s::KubernetesVersion& version, int minimum_major, int minimum_minor) {
    if (version.major > minimum_major || (version.major == minimum_major && version.minor >= minimum_minor)) {
        return;
    }
    throw CheckError(fmt::format(
        "Kubernetes is on version [{}.{}], but version [{}.{}] or more recent is required",
        version.major,
        version.minor,
        minimum_major,
        minimum_minor));
}

}  // namespace meshdiag::healthcheck
