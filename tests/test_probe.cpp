/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "fake_runner.hpp"
#include "motionq/probe.hpp"

using namespace motionq;
using namespace motionq::test;

TEST_CASE("DeviceProbe parsing", "[probe]") {
    SECTION("Override names map onto capabilities") {
        REQUIRE(DeviceProbe::parseOverride("gsplat_cuda") == DeviceCapability::GsplatCuda);
        REQUIRE(DeviceProbe::parseOverride("CUDA") == DeviceCapability::CudaNoGsplat);
        REQUIRE(DeviceProbe::parseOverride("mps") == DeviceCapability::FallbackOnly);
        REQUIRE(DeviceProbe::parseOverride("fallback") == DeviceCapability::FallbackOnly);
        REQUIRE_FALSE(DeviceProbe::parseOverride("tpu").has_value());
    }

    SECTION("Probe output needs both cuda and gsplat for the primary path") {
        std::string device;
        REQUIRE(DeviceProbe::parseProbeOutput("cuda gsplat", device) == DeviceCapability::GsplatCuda);
        REQUIRE(device == "cuda");
        REQUIRE(DeviceProbe::parseProbeOutput("CUDA\n", device) == DeviceCapability::CudaNoGsplat);
        REQUIRE(device == "cuda");
        REQUIRE(DeviceProbe::parseProbeOutput("mps gsplat", device) == DeviceCapability::FallbackOnly);
        REQUIRE(device == "mps");
        REQUIRE(DeviceProbe::parseProbeOutput("", device) == DeviceCapability::FallbackOnly);
        REQUIRE(device == "cpu");
    }
}

TEST_CASE("DeviceProbe detection", "[probe]") {
    FakeRunner runner;

    SECTION("Detection runs once per probe object") {
        DeviceProbe probe(runner);
        REQUIRE(probe.capability() == DeviceCapability::GsplatCuda);
        REQUIRE(probe.capability() == DeviceCapability::GsplatCuda);
        REQUIRE(probe.device() == "cuda");
        REQUIRE(runner.probeCalls() == 1);
    }

    SECTION("Override skips the helper") {
        DeviceProbe probe(runner, "fallback");
        REQUIRE(probe.capability() == DeviceCapability::FallbackOnly);
        REQUIRE(probe.device() == "cpu");
        REQUIRE(runner.probeCalls() == 0);
    }

    SECTION("Unknown override falls through to the helper") {
        DeviceProbe probe(runner, "warp-drive");
        REQUIRE(probe.capability() == DeviceCapability::GsplatCuda);
        REQUIRE(runner.probeCalls() == 1);
    }

    SECTION("Failed probe degrades to fallback") {
        runner.probeResult = {false, "", "no driver"};
        DeviceProbe probe(runner);
        REQUIRE(probe.capability() == DeviceCapability::FallbackOnly);
        REQUIRE(probe.device() == "cpu");
    }

    SECTION("Missing helper degrades to fallback without probing") {
        runner.isAvailable = false;
        DeviceProbe probe(runner);
        REQUIRE(probe.capability() == DeviceCapability::FallbackOnly);
        REQUIRE(runner.probeCalls() == 0);
    }
}
