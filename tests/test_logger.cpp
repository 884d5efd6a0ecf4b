/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <string>
#include <thread>

#include "motionq/logger.hpp"

using namespace motionq;

TEST_CASE("Logger", "[logger]") {
    SECTION("Level names parse case-insensitively") {
        REQUIRE(Logger::parseLevel("DEBUG", LogLevel::INFO) == LogLevel::DEBUG);
        REQUIRE(Logger::parseLevel("warning", LogLevel::INFO) == LogLevel::WARN);
        REQUIRE(Logger::parseLevel("verbose", LogLevel::ERROR) == LogLevel::ERROR);
    }

    SECTION("Lines carry level, thread name and message") {
        std::string line;
        std::thread worker([&line] {
            setThreadName("Worker");
            line = Logger::format(LogLevel::WARN, "disk almost full");
        });
        worker.join();
        REQUIRE(line.find("[WARN ] [Worker] disk almost full") != std::string::npos);
    }

    SECTION("Job scope tags lines and restores the outer tag") {
        REQUIRE(currentLogJob().empty());
        REQUIRE(Logger::format(LogLevel::INFO, "idle").find("job=") == std::string::npos);
        {
            LogJobScope outer("a1b2c3");
            REQUIRE(Logger::format(LogLevel::INFO, "staging").find(" job=a1b2c3] staging") != std::string::npos);
            {
                LogJobScope inner("d4e5f6");
                REQUIRE(currentLogJob() == "d4e5f6");
            }
            REQUIRE(currentLogJob() == "a1b2c3");
        }
        REQUIRE(currentLogJob().empty());
    }

    SECTION("Job tags are per thread") {
        LogJobScope scope("a1b2c3");
        std::string seen = "unset";
        std::thread other([&seen] { seen = currentLogJob(); });
        other.join();
        REQUIRE(seen.empty());
        REQUIRE(currentLogJob() == "a1b2c3");
    }
}
