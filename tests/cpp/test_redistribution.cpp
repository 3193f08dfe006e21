/**
 * @file test_redistribution.cpp
 * @brief Tests for energy redistribution after member failure
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "collapsex/errors.hpp"
#include "collapsex/redistribution.hpp"
#include "collapsex/warnings.hpp"
#include "frame_fixtures.hpp"

using namespace collapsex;
using namespace collapsex_test;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

Eigen::VectorXd field(std::initializer_list<double> values) {
    Eigen::VectorXd v(values.size());
    int i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

}  // namespace

TEST_CASE("Energy goes to neighbours in proportion to their energy", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(1)->active = false;

    WarningList warnings;
    EnergyRedistributor redistributor;
    RedistributionResult r = redistributor.redistribute(field({1.0, 2.0, 3.0, 5.0}), {1},
                                                        fx.frame, &warnings);

    REQUIRE_THAT(r.energy(0), WithinRel(1.5, 1e-12));
    REQUIRE(r.energy(1) == 0.0);
    REQUIRE_THAT(r.energy(2), WithinRel(4.5, 1e-12));
    REQUIRE(r.energy(3) == 5.0);

    REQUIRE_THAT(r.total_before, WithinRel(11.0, 1e-12));
    REQUIRE_THAT(r.total_after, WithinRel(11.0, 1e-12));
    REQUIRE(r.dissipated == 0.0);
    REQUIRE_FALSE(warnings.has_warnings());
}

TEST_CASE("Dissipation removes a fraction of the released energy", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(1)->active = false;

    RedistributionConfig config;
    config.dissipation_fraction = 0.25;
    EnergyRedistributor redistributor(config);
    RedistributionResult r = redistributor.redistribute(field({1.0, 2.0, 3.0, 0.0}), {1}, fx.frame);

    REQUIRE_THAT(r.dissipated, WithinRel(0.5, 1e-12));
    REQUIRE_THAT(r.energy(0), WithinRel(1.375, 1e-12));
    REQUIRE_THAT(r.energy(2), WithinRel(4.125, 1e-12));
    REQUIRE_THAT(r.total_after, WithinRel(r.total_before - r.dissipated, 1e-12));
}

TEST_CASE("Unloaded neighbours share equally", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(1)->active = false;

    RedistributionResult r = EnergyRedistributor().redistribute(field({0.0, 2.0, 0.0, 7.0}), {1},
                                                                fx.frame);
    REQUIRE_THAT(r.energy(0), WithinRel(1.0, 1e-12));
    REQUIRE_THAT(r.energy(2), WithinRel(1.0, 1e-12));
    REQUIRE(r.energy(3) == 7.0);
}

TEST_CASE("Isolated failure spreads over all survivors", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(3)->active = false;

    WarningList warnings;
    RedistributionResult r = EnergyRedistributor().redistribute(field({1.0, 1.0, 2.0, 4.0}), {3},
                                                                fx.frame, &warnings, 6);

    REQUIRE_THAT(r.energy(0), WithinRel(2.0, 1e-12));
    REQUIRE_THAT(r.energy(1), WithinRel(2.0, 1e-12));
    REQUIRE_THAT(r.energy(2), WithinRel(4.0, 1e-12));
    REQUIRE(r.energy(3) == 0.0);

    REQUIRE(warnings.count_by_code(WarningCode::NO_SURVIVING_NEIGHBOUR) == 1);
    REQUIRE(warnings.warnings.front().step == 6);
}

TEST_CASE("Energy is dissipated when nothing survives", "[EnergyRedistributor]") {
    ChainFixture fx;
    for (auto& m : fx.frame.members) m.active = false;

    WarningList warnings;
    RedistributionResult r = EnergyRedistributor().redistribute(field({3.0, 0.0, 0.0, 0.0}), {0},
                                                                fx.frame, &warnings);

    REQUIRE(r.energy.isZero());
    REQUIRE_THAT(r.dissipated, WithinRel(3.0, 1e-12));
    REQUIRE_THAT(r.total_after, WithinAbs(0.0, 1e-15));
    REQUIRE(warnings.count_by_code(WarningCode::ENERGY_LOST_NO_RECEIVER) == 1);
}

TEST_CASE("Several failures in one step conserve energy", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(0)->active = false;
    fx.frame.find_member(1)->active = false;

    RedistributionResult r = EnergyRedistributor().redistribute(field({1.0, 2.0, 3.0, 0.5}),
                                                                {0, 1}, fx.frame);

    REQUIRE(r.energy(0) == 0.0);
    REQUIRE(r.energy(1) == 0.0);
    REQUIRE_THAT(r.total_after, WithinRel(6.5, 1e-12));
    REQUIRE(r.energy(2) > 3.0);
}

TEST_CASE("Redistribution rejects bad input", "[EnergyRedistributor]") {
    ChainFixture fx;
    EnergyRedistributor redistributor;

    REQUIRE_THROWS_AS(redistributor.redistribute(field({1.0, 2.0}), {0}, fx.frame),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(redistributor.redistribute(field({1.0, 2.0, 3.0, 4.0}), {42}, fx.frame),
                      std::out_of_range);

    RedistributionConfig config;
    config.dissipation_fraction = 1.5;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
}

TEST_CASE("Overflowing energy totals raise a numeric error", "[EnergyRedistributor]") {
    ChainFixture fx;
    fx.frame.find_member(1)->active = false;

    try {
        EnergyRedistributor().redistribute(field({1e308, 1e308, 1e308, 1.0}), {1}, fx.frame);
        FAIL("Non-finite energy total was accepted");
    } catch (const NumericError& e) {
        REQUIRE(e.error().code == ErrorCode::NUMERICAL_OVERFLOW);
        REQUIRE(e.error().involved_members == std::vector<int>{1});
    }
}
