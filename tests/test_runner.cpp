/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "fake_runner.hpp"
#include "motionq/runner.hpp"

using namespace motionq;
using namespace motionq::test;

TEST_CASE("CommandRunner", "[runner]") {
    SECTION("Arguments are single-quoted for the shell") {
        REQUIRE(CommandRunner::shellQuote("plain") == "'plain'");
        REQUIRE(CommandRunner::shellQuote("a b") == "'a b'");
        REQUIRE(CommandRunner::shellQuote("it's") == "'it'\\''s'");
    }

    SECTION("No command means unavailable") {
        CommandRunner runner("");
        REQUIRE_FALSE(runner.available());
        REQUIRE_FALSE(runner.acquireDevice());
        auto result = runner.probe();
        REQUIRE_FALSE(result.ok);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("Helper output is captured") {
        CommandRunner runner("echo cuda gsplat");
        auto result = runner.probe();
        REQUIRE(result.ok);
        REQUIRE(result.output == "cuda gsplat probe");
    }

    SECTION("Non-zero exit reports the code") {
        CommandRunner runner("false");
        auto result = runner.probe();
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error.find("exited with code 1") != std::string::npos);
    }
}

TEST_CASE("DeviceLease", "[runner]") {
    FakeRunner runner;

    SECTION("Lease acquires and releases exactly once") {
        {
            DeviceLease lease(runner);
            REQUIRE(lease.held());
            REQUIRE(runner.acquires() == 1);
            REQUIRE(runner.releases() == 0);
        }
        REQUIRE(runner.releases() == 1);
    }

    SECTION("Failed acquisition is not released") {
        runner.acquireSucceeds = false;
        {
            DeviceLease lease(runner);
            REQUIRE_FALSE(lease.held());
        }
        REQUIRE(runner.acquires() == 1);
        REQUIRE(runner.releases() == 0);
    }
}
