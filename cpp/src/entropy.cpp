#include "collapsex/entropy.hpp"
#include "collapsex/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace collapsex {

Eigen::VectorXd energy_shares(const Eigen::VectorXd& energy) {
    double total = energy.sum();
    if (!(total > 0.0)) {
        return Eigen::VectorXd::Zero(energy.size());
    }
    return energy / total;
}

double shannon_entropy(const Eigen::VectorXd& shares) {
    double S = 0.0;
    for (int i = 0; i < shares.size(); ++i) {
        double p = shares(i);
        if (p > 0.0) {
            S -= p * std::log(p);
        }
    }
    return S;
}

double max_entropy(int n) {
    return n > 1 ? std::log(static_cast<double>(n)) : 0.0;
}

double gini_index(const Eigen::VectorXd& values) {
    const int n = static_cast<int>(values.size());
    double total = values.sum();
    if (n <= 1 || !(total > 0.0)) {
        return 0.0;
    }

    std::vector<double> sorted(values.data(), values.data() + n);
    std::sort(sorted.begin(), sorted.end());

    double weighted = 0.0;
    for (int i = 0; i < n; ++i) {
        weighted += static_cast<double>(i + 1) * sorted[i];
    }

    double G = 2.0 * weighted / (n * total) - static_cast<double>(n + 1) / n;
    return std::max(0.0, G);
}

std::vector<std::pair<int, double>> most_localized_members(const std::vector<int>& member_ids,
                                                           const Eigen::VectorXd& shares,
                                                           int top_n) {
    if (static_cast<int>(member_ids.size()) != shares.size()) {
        throw std::invalid_argument("member_ids and shares must have the same size");
    }

    std::vector<int> order(member_ids.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        if (shares(a) != shares(b)) return shares(a) > shares(b);
        return member_ids[a] < member_ids[b];
    });

    std::vector<std::pair<int, double>> top;
    for (int k = 0; k < static_cast<int>(order.size()) && k < top_n; ++k) {
        top.emplace_back(member_ids[order[k]], shares(order[k]));
    }
    return top;
}

EntropyMetrics EntropyEvaluator::evaluate(const Eigen::VectorXd& energy, const FrameData& frame,
                                          const double* previous, WarningList* warnings,
                                          int step) const {
    if (energy.size() != frame.num_members()) {
        throw std::invalid_argument("Energy field size does not match member count");
    }

    std::vector<double> population;
    for (int i = 0; i < frame.num_members(); ++i) {
        if (frame.members[i].active) population.push_back(energy(i));
    }

    Eigen::VectorXd pop = Eigen::Map<Eigen::VectorXd>(population.data(),
                                                      static_cast<Eigen::Index>(population.size()));
    return evaluate(pop, previous, warnings, step);
}

EntropyMetrics EntropyEvaluator::evaluate(const Eigen::VectorXd& population_energy,
                                          const double* previous, WarningList* warnings,
                                          int step) const {
    EntropyMetrics m;
    m.population = static_cast<int>(population_energy.size());
    m.total_energy = population_energy.sum();
    m.max_entropy = max_entropy(m.population);

    if (!(m.total_energy > 0.0)) {
        m.zero_energy = true;
        CollapsexWarning warn = CollapsexWarning::zero_total_energy();
        warn.step = step;
        logger()->warn("Step {}: total strain energy is zero, entropy set to zero", step);
        if (warnings) warnings->add(std::move(warn));
    } else {
        Eigen::VectorXd p = energy_shares(population_energy);
        m.entropy = shannon_entropy(p);
        m.gini = gini_index(p);
        if (m.max_entropy > 0.0) {
            m.normalized_entropy = std::min(1.0, std::max(0.0, m.entropy / m.max_entropy));
        }
    }

    m.entropy_rate = previous != nullptr ? m.entropy - *previous : 0.0;
    return m;
}

} // namespace collapsex
