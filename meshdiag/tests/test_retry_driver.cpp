// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <healthcheck/retry_driver.hpp>

using namespace std::chrono_literals;
using namespace meshdiag::healthcheck;

namespace {

CheckResult result(const std::string& description, bool failed = false, bool retry = false) {
    CheckResult r;
    r.category = "cat";
    r.description = description;
    if (failed) {
        r.error = description + " failed";
    }
    r.retry = retry;
    return r;
}

// Scripted rounds: round N reports rounds_[min(N, last)].
class ScriptedRun {
public:
    explicit ScriptedRun(std::vector<std::vector<CheckResult>> rounds) : rounds_(std::move(rounds)) {}

    CheckRun run() {
        return [this](const CheckObserver& observer) {
            const auto& round = rounds_[std::min(calls_, rounds_.size() - 1)];
            calls_++;
            bool success = true;
            for (const auto& r : round) {
                if (r.failed_hard()) {
                    success = false;
                }
                observer(r);
            }
            return success;
        };
    }

    size_t calls() const { return calls_; }

private:
    std::vector<std::vector<CheckResult>> rounds_;
    size_t calls_ = 0;
};

class RetryDriverTest : public ::testing::Test {
protected:
    CheckObserver observer() {
        return [this](const CheckResult& r) { seen_.push_back(r.description + (r.error ? " x" : " ok")); };
    }

    std::vector<std::string> seen_;
};

TEST_F(RetryDriverTest, SuccessfulFirstRoundReportsEverythingOnce) {
    ScriptedRun script({{result("a"), result("b")}});
    EXPECT_TRUE(run_checks_with_retry(script.run(), observer(), std::chrono::steady_clock::now() + 5s, 10ms));
    EXPECT_EQ(script.calls(), 1);
    EXPECT_THAT(seen_, ::testing::ElementsAre("a ok", "b ok"));
}

TEST_F(RetryDriverTest, FailureWithoutRetryFlagStopsImmediately) {
    ScriptedRun script({{result("a", true), result("b")}});
    EXPECT_FALSE(run_checks_with_retry(script.run(), observer(), std::chrono::steady_clock::now() + 5s, 10ms));
    EXPECT_EQ(script.calls(), 1);
    EXPECT_THAT(seen_, ::testing::ElementsAre("a x", "b ok"));
}

TEST_F(RetryDriverTest, RetriesUntilHealthyShowingOnlyRetryResultsInBetween) {
    ScriptedRun script({
        {result("a"), result("pods", true, true)},
        {result("a"), result("pods", true, true)},
        {result("a"), result("pods")},
    });
    EXPECT_TRUE(run_checks_with_retry(script.run(), observer(), std::chrono::steady_clock::now() + 5s, 1ms));
    EXPECT_EQ(script.calls(), 3);
    EXPECT_THAT(seen_, ::testing::ElementsAre("pods x", "pods x", "a ok", "pods ok"));
}

TEST_F(RetryDriverTest, DeadlineEndsRetryingWithFullReport) {
    ScriptedRun script({{result("a"), result("pods", true, true)}});
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(run_checks_with_retry(script.run(), observer(), start + 100ms, 20ms));

    EXPECT_GE(script.calls(), 2);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    // The final round is reported in full.
    ASSERT_GE(seen_.size(), 2);
    EXPECT_EQ(seen_[seen_.size() - 2], "a ok");
    EXPECT_EQ(seen_.back(), "pods x");
}

TEST_F(RetryDriverTest, ExpiredDeadlineRunsExactlyOnce) {
    ScriptedRun script({{result("pods", true, true)}});
    EXPECT_FALSE(run_checks_with_retry(script.run(), observer(), std::chrono::steady_clock::now() - 1s, 1s));
    EXPECT_EQ(script.calls(), 1);
    EXPECT_THAT(seen_, ::testing::ElementsAre("pods x"));
}

TEST_F(RetryDriverTest, RejectsMissingCallbacks) {
    EXPECT_THROW(
        run_checks_with_retry(CheckRun{}, observer(), std::chrono::steady_clock::now(), 1ms), std::runtime_error);
    ScriptedRun script({{result("a")}});
    EXPECT_THROW(
        run_checks_with_retry(script.run(), CheckObserver{}, std::chrono::steady_clock::now(), 1ms),
        std::runtime_error);
}

}  // namespace
