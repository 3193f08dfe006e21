/**
 * @file test_entropy.cpp
 * @brief Tests for the entropy measures of the energy distribution
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "collapsex/entropy.hpp"
#include "collapsex/warnings.hpp"
#include "frame_fixtures.hpp"

#include <cmath>

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

TEST_CASE("Uniform energy has maximum entropy and no concentration", "[Entropy]") {
    EntropyMetrics m = EntropyEvaluator().evaluate(field({2.0, 2.0, 2.0, 2.0}));

    REQUIRE_THAT(m.entropy, WithinRel(std::log(4.0), 1e-12));
    REQUIRE_THAT(m.max_entropy, WithinRel(std::log(4.0), 1e-12));
    REQUIRE_THAT(m.normalized_entropy, WithinRel(1.0, 1e-12));
    REQUIRE_THAT(m.gini, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.total_energy, WithinRel(8.0, 1e-12));
    REQUIRE(m.population == 4);
    REQUIRE(m.entropy_rate == 0.0);
}

TEST_CASE("Fully concentrated energy has zero entropy", "[Entropy]") {
    EntropyMetrics m = EntropyEvaluator().evaluate(field({0.0, 0.0, 5.0, 0.0}));

    REQUIRE(m.entropy == 0.0);
    REQUIRE(m.normalized_entropy == 0.0);
    // Largest possible Gini for n members is 1 - 1/n
    REQUIRE_THAT(m.gini, WithinRel(0.75, 1e-12));
}

TEST_CASE("Entropy measures stay within their bounds", "[Entropy]") {
    Eigen::VectorXd energy = field({0.1, 4.0, 0.0, 2.5, 9.0, 0.3, 1.2});
    const int n = static_cast<int>(energy.size());
    EntropyMetrics m = EntropyEvaluator().evaluate(energy);

    REQUIRE(m.entropy >= 0.0);
    REQUIRE(m.entropy <= std::log(static_cast<double>(n)));
    REQUIRE(m.normalized_entropy >= 0.0);
    REQUIRE(m.normalized_entropy <= 1.0);
    REQUIRE(m.gini >= 0.0);
    REQUIRE(m.gini < 1.0);
    REQUIRE(m.gini <= 1.0 - 1.0 / n + 1e-12);
}

TEST_CASE("Gini index of a known distribution", "[Entropy]") {
    // Sorted shares 0.1, 0.2, 0.3, 0.4: 2·(0.1 + 0.4 + 0.9 + 1.6)/4 - 5/4 = 0.25
    REQUIRE_THAT(gini_index(field({0.4, 0.1, 0.3, 0.2})), WithinRel(0.25, 1e-12));
    REQUIRE(gini_index(field({3.0})) == 0.0);
    REQUIRE(gini_index(field({0.0, 0.0})) == 0.0);
}

TEST_CASE("A single member has zero entropy and zero Gini", "[Entropy]") {
    EntropyMetrics m = EntropyEvaluator().evaluate(field({12.0}));

    REQUIRE(m.entropy == 0.0);
    REQUIRE(m.max_entropy == 0.0);
    REQUIRE(m.normalized_entropy == 0.0);
    REQUIRE(m.gini == 0.0);
    REQUIRE_FALSE(m.zero_energy);
}

TEST_CASE("Zero total energy gives zero entropy with a warning", "[Entropy]") {
    WarningList warnings;
    EntropyMetrics m = EntropyEvaluator().evaluate(field({0.0, 0.0, 0.0}), nullptr, &warnings, 2);

    REQUIRE(m.zero_energy);
    REQUIRE(m.entropy == 0.0);
    REQUIRE(m.normalized_entropy == 0.0);
    REQUIRE(m.gini == 0.0);
    REQUIRE(warnings.count_by_code(WarningCode::ZERO_TOTAL_ENERGY) == 1);
    REQUIRE(warnings.warnings.front().step == 2);

    REQUIRE(energy_shares(field({0.0, 0.0})).isZero());
}

TEST_CASE("Entropy rate is the backward difference", "[Entropy]") {
    double previous = std::log(4.0);
    EntropyMetrics m = EntropyEvaluator().evaluate(field({1.0, 1.0}), &previous);

    REQUIRE_THAT(m.entropy_rate, WithinRel(std::log(2.0) - std::log(4.0), 1e-12));
}

TEST_CASE("Only active members form the population", "[Entropy]") {
    ChainFixture fx;
    fx.frame.find_member(3)->active = false;

    EntropyMetrics m = EntropyEvaluator().evaluate(field({1.0, 1.0, 1.0, 0.0}), fx.frame);
    REQUIRE(m.population == 3);
    REQUIRE_THAT(m.normalized_entropy, WithinRel(1.0, 1e-12));

    REQUIRE_THROWS_AS(EntropyEvaluator().evaluate(field({1.0}), fx.frame), std::invalid_argument);
}

TEST_CASE("Most localized members are ranked by share", "[Entropy]") {
    std::vector<int> ids = {10, 11, 12, 13};
    auto top = most_localized_members(ids, field({0.1, 0.4, 0.1, 0.4}), 3);

    REQUIRE(top.size() == 3);
    REQUIRE(top[0].first == 11);
    REQUIRE(top[1].first == 13);
    REQUIRE(top[2].first == 10);
    REQUIRE_THAT(top[0].second, WithinRel(0.4, 1e-12));

    REQUIRE(most_localized_members({5}, field({1.0}), 3).size() == 1);
}
