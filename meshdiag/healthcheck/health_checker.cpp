// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <utility>

#include <fmt/format.h>

#include <tt-logger/tt-logger.hpp>
#include <meshdiag_stl/assert.hpp>
#include <meshdiag_stl/overloaded.hpp>

#include <healthcheck/health_checker.hpp>

namespace meshdiag::healthcheck {

namespace {

CheckResult make_result(const Check& check) {
    CheckResult result;
    result.category = check.category;
    result.description = check.description;
    result.warning = check.warning;
    return result;
}

// Invokes `fn`, recording any failure it throws into `result`. Returns false if it threw.
template <typename Fn>
bool invoke_into(CheckResult& result, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const CheckError& e) {
        result.error = e.what();
        result.retry = e.retryable();
    } catch (const std::exception& e) {
        result.error = e.what();
    } catch (...) {
        result.error = "unknown error";
    }
    return false;
}

// A fatal failure ends the run, except when the check asked to be retried later.
bool halts_run(const Check& check, const CheckResult& result) {
    return check.fatal && result.error.has_value() && !result.retry;
}

}  // namespace

std::string subsystem_category(const std::string& category, const std::string& subsystem_name) {
    return fmt::format("{}[{}]", category, subsystem_name);
}

void HealthChecker::add(std::string category, std::string description, std::function<void()> check, bool fatal) {
    add_check(Check{
        .category = std::move(category),
        .description = std::move(description),
        .fatal = fatal,
        .warning = false,
        .kind = LocalCheck{std::move(check)},
    });
}

void HealthChecker::add_warning(std::string category, std::string description, std::function<void()> check) {
    add_check(Check{
        .category = std::move(category),
        .description = std::move(description),
        .fatal = false,
        .warning = true,
        .kind = LocalCheck{std::move(check)},
    });
}

void HealthChecker::add_rpc(
    std::string category, std::string description, std::function<SelfCheckResponse()> rpc, bool fatal) {
    add_check(Check{
        .category = std::move(category),
        .description = std::move(description),
        .fatal = fatal,
        .warning = false,
        .kind = RemoteCheck{std::move(rpc)},
    });
}

void HealthChecker::add_check(Check check) {
    const bool callable = std::visit([](const auto& kind) { return static_cast<bool>(kind.run); }, check.kind);
    MESHDIAG_FATAL(callable, "Check '{}: {}' has no function to run", check.category, check.description);
    checks_.push_back(std::move(check));
}

void HealthChecker::add_category(const std::string& category, std::vector<Check> checks) {
    for (auto& check : checks) {
        check.category = category;
        add_check(std::move(check));
    }
}

bool HealthChecker::run_checks(const CheckObserver& observer) const {
    MESHDIAG_FATAL(static_cast<bool>(observer), "run_checks requires an observer");

    bool success = true;
    auto report = [&](const CheckResult& result) {
        if (result.failed_hard()) {
            success = false;
        }
        observer(result);
    };

    for (const auto& check : checks_) {
        const bool halt = std::visit(
            meshdiag::stl::overloaded{
                [&](const LocalCheck& local) {
                    CheckResult result = make_result(check);
                    invoke_into(result, local.run);
                    report(result);
                    return halts_run(check, result);
                },
                [&](const RemoteCheck& remote) {
                    CheckResult transport = make_result(check);
                    SelfCheckResponse response;
                    if (!invoke_into(transport, [&] { response = remote.run(); })) {
                        report(transport);
                        return halts_run(check, transport);
                    }

                    // Subsystem failures are never fatal, only the call itself can halt the run.
                    for (const auto& subsystem : response.results) {
                        CheckResult result;
                        result.category = subsystem_category(check.category, subsystem.subsystem_name);
                        result.description = subsystem.description;
                        if (subsystem.status != SubsystemStatus::Ok) {
                            result.error = fmt::format("{}", subsystem.friendly_message);
                        }
                        report(result);
                    }
                    return false;
                },
            },
            check.kind);

        if (halt) {
            log_debug(
                tt::LogAlways,
                "[HealthChecker] Fatal check '{}: {}' failed, skipping remaining checks",
                check.category,
                check.description);
            break;
        }
    }

    return success;
}

}  // namespace meshdiag::healthcheck
