/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "motionq/logger.hpp"

int main(int argc, char* argv[]) {
    motionq::Logger::setLevel(motionq::LogLevel::ERROR);
    return Catch::Session().run(argc, argv);
}
