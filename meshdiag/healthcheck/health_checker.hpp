// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <healthcheck/check.hpp>

namespace meshdiag::healthcheck {

/*
 * HealthChecker runs an ordered list of checks, one at a time, on the calling thread.
 *
 * Checks must be appended in dependency order: a later check may rely on side effects of an
 * earlier one (for example a client created by a previous check). The engine does not enforce
 * this. A failing fatal check stops the run, unless its failure carries a retry hint.
 *
 * The engine holds no per-run state, so run_checks() may be called repeatedly by a polling driver.
 */
class HealthChecker {
public:
    HealthChecker() = default;

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;
    HealthChecker(HealthChecker&&) = default;
    HealthChecker& operator=(HealthChecker&&) = default;

    void add(std::string category, std::string description, std::function<void()> check, bool fatal = false);

    // A warning check is surfaced when it fails but never makes the run unsuccessful.
    void add_warning(std::string category, std::string description, std::function<void()> check);

    void add_rpc(
        std::string category, std::string description, std::function<SelfCheckResponse()> rpc, bool fatal = false);

    void add_check(Check check);

    // Appends a group of checks, overriding each check's category with `category`.
    void add_category(const std::string& category, std::vector<Check> checks);

    // Runs every registered check in order, passing each result to `observer`. Returns true iff no
    // emitted result carried a non-warning error.
    bool run_checks(const CheckObserver& observer) const;

    size_t size() const { return checks_.size(); }
    bool empty() const { return checks_.empty(); }

private:
    std::vector<Check> checks_;
};

// Category name used for one subsystem of a remote self-check, e.g. "linkerd-api[grafana]".
std::string subsystem_category(const std::string& category, const std::string& subsystem_name);

}  // namespace meshdiag::healthcheck
