#include "collapsex/failure.hpp"
#include "collapsex/errors.hpp"
#include "collapsex/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace collapsex {

std::string failure_policy_to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::SingleMostOverstressed: return "single";
        case FailurePolicy::AllOverstressed: return "all";
        default: return "unknown";
    }
}

void FailureConfig::validate() const {
    if (!(tie_tolerance >= 0.0) || !std::isfinite(tie_tolerance)) {
        throw ConfigurationError(CollapsexError::invalid_parameter(
            "failure.tie_tolerance", "must be finite and non-negative"));
    }
}

MemberStress member_stress(const Member& member, const MemberResponse& response) {
    const Section& sec = *member.section;

    double N = std::max(std::abs(response.end_i.N), std::abs(response.end_j.N));
    double M = std::max(response.end_i.bending_moment(), response.end_j.bending_moment());

    MemberStress s;
    s.axial = N / sec.A;
    s.bending = M * sec.c / sec.I;
    s.total = s.axial + s.bending;
    s.ratio = s.total / member.material->sigma_lim;
    return s;
}

FailureDetector::FailureDetector(FailureConfig config) : config_(config) {}

std::vector<FailureEvent> FailureDetector::evaluate(const FrameData& frame,
                                                    const std::vector<MemberResponse>& responses,
                                                    int step, double load_factor) const {
    std::vector<FailureEvent> events;

    for (const auto& r : responses) {
        const Member* member = frame.find_member(r.member_id);
        if (member == nullptr || !member->active) continue;

        double ratio = member_stress(*member, r).ratio;
        if (ratio > 1.0) {
            events.push_back(FailureEvent{member->id, step, ratio, load_factor});
        }
    }

    std::sort(events.begin(), events.end(),
              [](const FailureEvent& a, const FailureEvent& b) { return a.member_id < b.member_id; });

    if (config_.policy == FailurePolicy::AllOverstressed || events.size() <= 1) {
        return events;
    }

    // Lowest id among the events within tolerance of the largest ratio
    double max_ratio = events.front().stress_ratio;
    for (const auto& e : events) {
        max_ratio = std::max(max_ratio, e.stress_ratio);
    }
    double margin = config_.tie_tolerance * std::max(std::abs(max_ratio), 1.0);
    for (const auto& e : events) {
        if (e.stress_ratio >= max_ratio - margin) {
            return {e};
        }
    }
    return {events.front()};
}

void FailureDetector::apply(FrameData& frame, const std::vector<FailureEvent>& events,
                            int failures_so_far) const {
    int order = failures_so_far;
    for (const auto& e : events) {
        Member* member = frame.find_member(e.member_id);
        if (member == nullptr) {
            throw std::out_of_range("Failure event references unknown member " +
                                    std::to_string(e.member_id));
        }
        if (!member->active) continue;

        member->active = false;
        member->failure_order = order++;
        logger()->info("Step {}: member {} failed (stress ratio {:.4f}, load factor {:.4f})",
                       e.step, e.member_id, e.stress_ratio, e.load_factor);
    }
}

} // namespace collapsex
