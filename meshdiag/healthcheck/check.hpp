// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
 * check.hpp
 *
 * Types shared by the checker engine, the category builders and the retry driver. A check is a
 * tagged variant over a local function and a remote self-check function; the engine turns either
 * form into one or more CheckResult values handed to an observer.
 */

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace meshdiag::healthcheck {

enum class SubsystemStatus { Ok, NotOk };

// One entry of a control plane self-check answer.
struct SubsystemResult {
    std::string subsystem_name;
    SubsystemStatus status = SubsystemStatus::Ok;
    std::string friendly_message;
    std::string description;
};

struct SelfCheckResponse {
    std::vector<SubsystemResult> results;
};

// Thrown by a check to fail with a retry hint. Any other std::exception is a plain failure.
class CheckError : public std::runtime_error {
public:
    explicit CheckError(const std::string& message, bool retryable = false) :
        std::runtime_error(message), retryable_(retryable) {}

    bool retryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

// A local check throws on failure and returns normally on success.
struct LocalCheck {
    std::function<void()> run;
};

// A remote check returns the self-check answer, or throws when the call itself could not complete.
struct RemoteCheck {
    std::function<SelfCheckResponse()> run;
};

struct Check {
    std::string category;
    std::string description;
    bool fatal = false;
    // A failing warning check is reported but does not make the run unsuccessful.
    bool warning = false;
    std::variant<LocalCheck, RemoteCheck> kind;
};

struct CheckResult {
    std::string category;
    std::string description;
    std::optional<std::string> error;
    bool retry = false;
    bool warning = false;

    bool passed() const { return !error.has_value(); }
    // True when this result makes the overall run unsuccessful.
    bool failed_hard() const { return error.has_value() && !warning; }
};

using CheckObserver = std::function<void(const CheckResult&)>;

}  // namespace meshdiag::healthcheck
