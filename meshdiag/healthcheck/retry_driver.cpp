// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cstdint>
#include <thread>
#include <vector>

#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>

#include <healthcheck/retry_driver.hpp>

namespace meshdiag::healthcheck {

bool run_checks_with_retry(
    const CheckRun& run,
    const CheckObserver& observer,
    std::chrono::steady_clock::time_point deadline,
    std::chrono::milliseconds interval) {
    MESHDIAG_FATAL(static_cast<bool>(run), "run_checks_with_retry requires a check run");
    MESHDIAG_FATAL(static_cast<bool>(observer), "run_checks_with_retry requires an observer");

    uint32_t round = 0;
    while (true) {
        round++;
        std::vector<CheckResult> results;
        const bool success = run([&results](const CheckResult& result) { results.push_back(result); });

        const bool wants_retry =
            std::any_of(results.begin(), results.end(), [](const CheckResult& r) { return r.retry; });
        const auto now = std::chrono::steady_clock::now();

        if (success || !wants_retry || now >= deadline) {
            if (!success && wants_retry) {
                log_warning(tt::LogAlways, "[RetryDriver] Deadline reached after {} round(s)", round);
            }
            for (const auto& result : results) {
                observer(result);
            }
            return success;
        }

        for (const auto& result : results) {
            if (result.retry) {
                observer(result);
            }
        }

        log_debug(tt::LogAlways, "[RetryDriver] Round {} asked for a retry", round);
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining));
    }
}

}  // namespace meshdiag::healthcheck
