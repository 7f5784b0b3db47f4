// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>

#include <meshdiag_stl/assert.hpp>
#include <meshdiag_stl/cleanup.hpp>
#include <meshdiag_stl/overloaded.hpp>

using ::testing::HasSubstr;

namespace {

std::string fatal_message(int value) {
    try {
        MESHDIAG_FATAL(value > 0, "value must be positive, got {}", value);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

TEST(MeshdiagFatalTest, PassingConditionDoesNothing) {
    EXPECT_NO_THROW(MESHDIAG_FATAL(1 + 1 == 2, "arithmetic"));
    EXPECT_EQ(fatal_message(3), "");
}

TEST(MeshdiagFatalTest, FailingConditionThrowsWithLocationAndMessage) {
    const std::string message = fatal_message(-4);
    EXPECT_THAT(message, HasSubstr("MESHDIAG_FATAL @ "));
    EXPECT_THAT(message, HasSubstr("test_stl.cpp:"));
    EXPECT_THAT(message, HasSubstr("value > 0"));
    EXPECT_THAT(message, HasSubstr("value must be positive, got -4"));
}

TEST(MeshdiagFatalTest, MessageWithoutArguments) {
    EXPECT_THROW(MESHDIAG_FATAL(false, "always fails"), std::runtime_error);
}

TEST(CleanupTest, RunsOnScopeExitAndOnException) {
    int runs = 0;
    {
        auto cleanup = meshdiag::stl::make_cleanup([&runs] { runs++; });
        EXPECT_EQ(runs, 0);
    }
    EXPECT_EQ(runs, 1);

    try {
        auto cleanup = meshdiag::stl::make_cleanup([&runs] { runs++; });
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(runs, 2);
}

TEST(OverloadedTest, DispatchesOnAlternative) {
    std::variant<int, std::string> value = std::string("linkerd");
    auto describe = meshdiag::stl::overloaded{
        [](int i) { return "int " + std::to_string(i); },
        [](const std::string& s) { return "string " + s; },
    };
    EXPECT_EQ(std::visit(describe, value), "string linkerd");
    value = 7;
    EXPECT_EQ(std::visit(describe, value), "int 7");
}

}  // namespace
