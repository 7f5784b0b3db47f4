// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <utils/result_funnel.hpp>

using namespace std::chrono_literals;
using ::testing::UnorderedElementsAre;

namespace {

TEST(ResultFunnelTest, ReturnsAsSoonAsAllItemsArrive) {
    auto funnel = std::make_shared<ResultFunnel<int>>(3);
    std::vector<std::thread> producers;
    for (int i = 0; i < 3; i++) {
        producers.emplace_back([funnel, i] { funnel->push(i); });
    }

    const auto start = std::chrono::steady_clock::now();
    auto items = funnel->drain_until(start + 30s);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_THAT(items, UnorderedElementsAre(0, 1, 2));

    for (auto& t : producers) {
        t.join();
    }
}

TEST(ResultFunnelTest, DeadlineReturnsPartialResultsAndSeals) {
    ResultFunnel<int> funnel(2);
    EXPECT_TRUE(funnel.push(7));
    EXPECT_EQ(funnel.outstanding(), 1);

    auto items = funnel.drain_until(std::chrono::steady_clock::now() + 50ms);
    EXPECT_THAT(items, UnorderedElementsAre(7));
    EXPECT_TRUE(funnel.sealed());

    // Late arrivals are dropped.
    EXPECT_FALSE(funnel.push(8));
    EXPECT_TRUE(funnel.drain_until(std::chrono::steady_clock::now()).empty());
}

TEST(ResultFunnelTest, ZeroExpectedDrainsImmediately) {
    ResultFunnel<int> funnel(0);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(funnel.drain_until(start + 30s).empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_EQ(funnel.expected(), 0);
}

}  // namespace
