/**
 * @file test_failure.cpp
 * @brief Tests for the stress criterion and failure selection policies
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "collapsex/errors.hpp"
#include "collapsex/failure.hpp"
#include "frame_fixtures.hpp"

using namespace collapsex;
using namespace collapsex_test;
using Catch::Matchers::WithinRel;

namespace {

/// Response whose only action is a moment Mz at end j
MemberResponse moment_response(int member_id, double Mz) {
    MemberResponse r;
    r.member_id = member_id;
    r.end_j.Mz = Mz;
    return r;
}

}  // namespace

TEST_CASE("Combined stress adds axial and bending parts", "[FailureDetector][stress]") {
    ChainFixture fx;
    MemberResponse r;
    r.member_id = 0;
    r.end_i.N = -1000.0;
    r.end_j.N = -1000.0;
    r.end_i.My = 600.0;
    r.end_i.Mz = 800.0;
    r.end_j.Mz = 200.0;

    MemberStress s = member_stress(fx.frame.members[0], r);

    // A = 0.01, I = 1e-4, c = 0.1, resultant moment 1000 at end i
    REQUIRE_THAT(s.axial, WithinRel(1e5, 1e-12));
    REQUIRE_THAT(s.bending, WithinRel(1e6, 1e-12));
    REQUIRE_THAT(s.total, WithinRel(1.1e6, 1e-12));
    REQUIRE_THAT(s.ratio, WithinRel(1.1e6 / 275e6, 1e-12));
}

TEST_CASE("Nothing fails below the stress limit", "[FailureDetector]") {
    ChainFixture fx;
    std::vector<MemberResponse> responses = {
        moment_response(0, 100e3), moment_response(1, 200e3), moment_response(2, 270e3)};

    FailureDetector detector;
    REQUIRE(detector.evaluate(fx.frame, responses, 0, 1.0).empty());
}

TEST_CASE("Single policy removes only the most overstressed member", "[FailureDetector]") {
    ChainFixture fx;
    std::vector<MemberResponse> responses = {
        moment_response(0, 300e3), moment_response(1, 400e3), moment_response(2, 350e3)};

    FailureDetector detector;
    auto events = detector.evaluate(fx.frame, responses, 3, 1.25);

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].member_id == 1);
    REQUIRE(events[0].step == 3);
    REQUIRE(events[0].load_factor == 1.25);
    REQUIRE_THAT(events[0].stress_ratio, WithinRel(400e6 / 275e6, 1e-12));
}

TEST_CASE("Ties go to the lowest member id", "[FailureDetector]") {
    ChainFixture fx;
    std::vector<MemberResponse> responses = {
        moment_response(2, 400e3), moment_response(1, 400e3), moment_response(0, 300e3)};

    FailureDetector detector;
    auto events = detector.evaluate(fx.frame, responses, 0, 1.0);

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].member_id == 1);
}

TEST_CASE("Tie tolerance is measured from the largest ratio", "[FailureDetector]") {
    ChainFixture fx;
    // Ratios 2, 2 + 1.8e-12 and 2 + 3.6e-12; the tie margin is 2e-12, so
    // member 1 ties with member 2 while member 0 does not
    std::vector<MemberResponse> responses = {
        moment_response(0, 550e3),
        moment_response(1, 550e3 * (1.0 + 0.9e-12)),
        moment_response(2, 550e3 * (1.0 + 1.8e-12))};

    FailureConfig config;
    config.tie_tolerance = 1e-12;
    auto events = FailureDetector(config).evaluate(fx.frame, responses, 0, 1.0);

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].member_id == 1);
}

TEST_CASE("All policy removes every overstressed member in id order", "[FailureDetector]") {
    ChainFixture fx;
    std::vector<MemberResponse> responses = {
        moment_response(2, 350e3), moment_response(0, 100e3),
        moment_response(1, 400e3), moment_response(3, 300e3)};

    FailureConfig config;
    config.policy = FailurePolicy::AllOverstressed;
    FailureDetector detector(config);
    auto events = detector.evaluate(fx.frame, responses, 0, 1.0);

    REQUIRE(events.size() == 3);
    REQUIRE(events[0].member_id == 1);
    REQUIRE(events[1].member_id == 2);
    REQUIRE(events[2].member_id == 3);
    for (const auto& e : events) {
        REQUIRE(e.stress_ratio > 1.0);
    }
}

TEST_CASE("Inactive members are never selected", "[FailureDetector]") {
    ChainFixture fx;
    fx.frame.find_member(1)->active = false;
    std::vector<MemberResponse> responses = {
        moment_response(1, 900e3), moment_response(2, 300e3)};

    auto events = FailureDetector().evaluate(fx.frame, responses, 0, 1.0);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].member_id == 2);
}

TEST_CASE("Applying failures deactivates members and stamps their order", "[FailureDetector]") {
    ChainFixture fx;
    FailureDetector detector;

    std::vector<FailureEvent> events = {{2, 4, 1.2, 1.0}, {0, 4, 1.1, 1.0}};
    detector.apply(fx.frame, events, 3);

    REQUIRE_FALSE(fx.frame.find_member(2)->active);
    REQUIRE_FALSE(fx.frame.find_member(0)->active);
    REQUIRE(fx.frame.find_member(1)->active);
    REQUIRE(fx.frame.find_member(2)->failure_order == 3);
    REQUIRE(fx.frame.find_member(0)->failure_order == 4);
    REQUIRE(fx.frame.find_member(1)->failure_order == -1);

    std::vector<FailureEvent> unknown = {{42, 5, 1.5, 1.0}};
    REQUIRE_THROWS_AS(detector.apply(fx.frame, unknown, 5), std::out_of_range);
}

TEST_CASE("FailureConfig validation", "[FailureDetector][config]") {
    FailureConfig config;
    REQUIRE_NOTHROW(config.validate());
    config.tie_tolerance = -1.0;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
}
