// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>

#include <healthcheck/check.hpp>

namespace meshdiag::healthcheck {

// One full pass over a set of checks, e.g. HealthChecker::run_checks.
using CheckRun = std::function<bool(const CheckObserver&)>;

/*
 * Re-runs `run` until it succeeds, a round fails without any result asking to be retried, or
 * `deadline` passes. While retrying, only the retry-flagged results of a round reach `observer`;
 * the last round is reported in full. Returns the success of the last round.
 */
bool run_checks_with_retry(
    const CheckRun& run,
    const CheckObserver& observer,
    std::chrono::steady_clock::time_point deadline,
    std::chrono::milliseconds interval);

}  // namespace meshdiag::healthcheck
