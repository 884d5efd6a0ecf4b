/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <fstream>

#include "helpers.hpp"
#include "motionq/job.hpp"
#include "motionq/metrics.hpp"

using namespace motionq;
using namespace motionq::test;

namespace {
MetricsEntry sample(int width, int height, double duration) {
    MetricsEntry entry;
    entry.job = "j" + std::to_string(width);
    entry.width = width;
    entry.height = height;
    entry.duration = duration;
    return entry;
}
}

TEST_CASE("Duration model", "[metrics]") {
    SECTION("No samples gives the default guess") {
        auto model = MetricsLog::fit({});
        REQUIRE(model.samples == 0);
        REQUIRE(model.slope == 0.0);
        REQUIRE(model.intercept == Approx(12.0));
        REQUIRE(model.estimate(1000, 1000) == Approx(12.0));
    }

    SECTION("One sample predicts its own duration") {
        auto model = MetricsLog::fit({sample(1000, 1000, 30.0)});
        REQUIRE(model.samples == 1);
        REQUIRE(model.estimate(4000, 3000) == Approx(30.0));
    }

    SECTION("Identical sizes average the durations") {
        auto model = MetricsLog::fit({sample(1000, 1000, 10.0), sample(1000, 1000, 20.0)});
        REQUIRE(model.slope == 0.0);
        REQUIRE(model.intercept == Approx(15.0));
    }

    SECTION("Least squares recovers a linear trend") {
        // duration = 5 + 2 * megapixels
        auto model = MetricsLog::fit({sample(1000, 1000, 7.0), sample(2000, 1000, 9.0), sample(2000, 2000, 13.0)});
        REQUIRE(model.samples == 3);
        REQUIRE(model.slope == Approx(2.0));
        REQUIRE(model.intercept == Approx(5.0));
        REQUIRE(model.estimate(3000, 1000) == Approx(11.0));
    }

    SECTION("Entries without dimensions are ignored") {
        auto model = MetricsLog::fit({sample(0, 0, 99.0), sample(1000, 1000, 8.0)});
        REQUIRE(model.samples == 1);
        REQUIRE(model.intercept == Approx(8.0));
    }
}

TEST_CASE("MetricsLog", "[metrics]") {
    TempDir dir;
    MetricsLog log(dir.path() / "data" / "metrics.json");

    SECTION("Missing file loads as empty") {
        REQUIRE(log.load().empty());
        REQUIRE(log.fitDurationModel().samples == 0);
    }

    SECTION("Completed jobs are appended") {
        JobView view;
        view.id = "abc";
        view.state = JobState::Done;
        view.imageName = "img1";
        view.width = 2000;
        view.height = 1000;
        view.backend = BackendKind::DepthParallax;
        view.device = "cpu";
        view.createdAt = std::chrono::system_clock::now() - std::chrono::seconds(5);
        view.finishedAt = view.createdAt + std::chrono::seconds(5);

        REQUIRE(log.record(view));
        REQUIRE(log.append(sample(1000, 1000, 3.0)));

        auto entries = log.load();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].job == "abc");
        REQUIRE(entries[0].imageName == "img1");
        REQUIRE(entries[0].width == 2000);
        REQUIRE(entries[0].duration == Approx(5.0).margin(0.01));
        REQUIRE(entries[0].device == "cpu");
        REQUIRE(log.fitDurationModel().samples == 2);
    }

    SECTION("Unfinished jobs are not recorded") {
        JobView view;
        view.id = "abc";
        view.state = JobState::Failed;
        view.finishedAt = std::chrono::system_clock::now();
        REQUIRE_FALSE(log.record(view));
        REQUIRE(log.load().empty());
    }

    SECTION("Names that are not UTF-8 are written with a replacement character") {
        auto entry = sample(1000, 1000, 3.0);
        entry.imageName = "caf\xe9";
        REQUIRE(log.append(entry));
        auto entries = log.load();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].imageName == "caf\xef\xbf\xbd");
    }

    SECTION("Unwritable location is reported instead of thrown") {
        {
            std::ofstream blocker(dir.path() / "data");
            blocker << "not a directory";
        }
        bool appended = true;
        REQUIRE_NOTHROW(appended = log.append(sample(1000, 1000, 3.0)));
        REQUIRE_FALSE(appended);
        REQUIRE(log.load().empty());
    }

    SECTION("Corrupt file is treated as empty and then replaced") {
        std::filesystem::create_directories(log.path().parent_path());
        {
            std::ofstream file(log.path());
            file << "{not json";
        }
        REQUIRE(log.load().empty());
        REQUIRE(log.append(sample(1000, 1000, 3.0)));
        REQUIRE(log.load().size() == 1);
    }
}
