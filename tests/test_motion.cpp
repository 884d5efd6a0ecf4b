/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <limits>

#include "motionq/motion.hpp"

using namespace motionq;

TEST_CASE("Motion parameters", "[motion]") {
    SECTION("Defaults fill every declared slider") {
        auto result = makeMotion("swipe", {});
        REQUIRE(result);
        REQUIRE(result.params.kind == MotionKind::Swipe);
        REQUIRE(result.params.sliders.size() == sliderSpecs().size());
        REQUIRE(result.params.value(slider::kDurationS) == Approx(4.0));
        REQUIRE(result.params.fps() == 30);
        REQUIRE(result.params.frameCount() == 120);
    }

    SECTION("Out-of-range values are clamped") {
        auto result = makeMotion("shake", {{slider::kFps, 500.0}, {slider::kMotionScale, -3.0}});
        REQUIRE(result);
        REQUIRE(result.params.fps() == 60);
        REQUIRE(result.params.value(slider::kMotionScale) == Approx(0.05));
    }

    SECTION("Integer sliders are rounded") {
        auto result = makeMotion("rotate", {{slider::kFps, 23.6}, {slider::kNumRepeats, 2.4}});
        REQUIRE(result);
        REQUIRE(result.params.value(slider::kFps) == Approx(24.0));
        REQUIRE(result.params.value(slider::kNumRepeats) == Approx(2.0));
    }

    SECTION("Frame count never drops below two") {
        auto result = makeMotion("swipe", {{slider::kDurationS, 0.2}, {slider::kFps, 6.0}});
        REQUIRE(result);
        REQUIRE(result.params.frameCount() == 2);
    }

    SECTION("rotate_push is an alias of rotate_forward") {
        REQUIRE(parseMotionKind("rotate_push") == MotionKind::RotatePush);
        REQUIRE(parseMotionKind("ROTATE_FORWARD") == MotionKind::RotatePush);
        REQUIRE(std::string(toString(MotionKind::RotatePush)) == "rotate_forward");
    }

    SECTION("Unknown motion kind is rejected") {
        auto result = makeMotion("spiral", {});
        REQUIRE_FALSE(result);
        REQUIRE(result.error.kind == ErrorKind::InvalidInput);
    }

    SECTION("Unknown slider is rejected") {
        auto result = makeMotion("swipe", {{"warp_factor", 1.0}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error.kind == ErrorKind::InvalidInput);
    }

    SECTION("Non-finite values are rejected") {
        auto result = makeMotion("swipe", {{slider::kMaxZoom, std::numeric_limits<double>::quiet_NaN()}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error.kind == ErrorKind::InvalidInput);
    }
}
