// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <k8s/kubernetes_api.hpp>

namespace meshdiag::healthcheck {

// Release versions are "<channel>-<version>", e.g. "stable-2.3.0" or "edge-19.4.5".
struct ChannelVersion {
    std::string channel;
    std::string version;

    std::string to_string() const { return channel + "-" + version; }
};

std::optional<ChannelVersion> parse_channel_version(const std::string& release);

// Latest published release per channel.
class Channels {
public:
    Channels() = default;
    explicit Channels(std::map<std::string, std::string> releases) : releases_(std::move(releases)) {}

    // Parses the version check endpoint's answer: {"stable": "stable-2.3.0", "edge": "edge-19.4.5"}.
    static Channels from_json(const std::string& body);
    // A single pinned release, used when the expected version is given explicitly.
    static Channels pinned(const std::string& release);

    // Latest release on the same channel as `current`. Throws CheckError if the channel is unknown.
    std::string latest_for(const std::string& current) const;

    bool empty() const { return releases_.empty(); }

private:
    std::map<std::string, std::string> releases_;
};

// Version of this build, e.g. "stable-0.1.0".
const std::string& client_version();

// Downloads the latest releases from `url`. Throws std::runtime_error on failure.
Channels fetch_latest_channels(const std::string& url, std::chrono::milliseconds timeout);

// Throws CheckError when `current` is older than the latest release on its channel. `who` names
// the component in the message ("cli", "control plane").
void check_up_to_date(const std::string& who, const std::string& current, const Channels& latest);

inline constexpr int MINIMUM_KUBERNETES_MAJOR = 1;
inline constexpr int MINIMUM_KUBERNETES_MINOR = 10;

// Throws CheckError when the cluster runs a Kubernetes older than the supported minimum.
void check_minimum_kubernetes_version(
    const k8s::KubernetesVersion& version,
    int minimum_major = MINIMUM_KUBERNETES_MAJOR,
    int minimum_minor = MINIMUM_KUBERNETES_MINOR);

}  // namespace meshdiag::healthcheck
