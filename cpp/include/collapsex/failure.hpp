#pragma once

#include "collapsex/equilibrium.hpp"
#include "collapsex/frame_data.hpp"

#include <string>
#include <vector>

namespace collapsex {

/**
 * @brief Which overstressed members fail in one step
 */
enum class FailurePolicy {
    SingleMostOverstressed,  ///< Only the member with the highest ratio > 1
    AllOverstressed          ///< Every member with ratio > 1
};

std::string failure_policy_to_string(FailurePolicy policy);

/**
 * @brief Failure detector configuration
 */
struct FailureConfig {
    FailurePolicy policy = FailurePolicy::SingleMostOverstressed;

    /// Relative tolerance under which two ratios are treated as tied
    double tie_tolerance = 1e-12;

    /**
     * @throws ConfigurationError if tie_tolerance is negative or non-finite
     */
    void validate() const;
};

/**
 * @brief Stress state of a member, as used by the failure criterion
 */
struct MemberStress {
    double axial = 0.0;    ///< |N| / A [Pa]
    double bending = 0.0;  ///< M_max · c / I [Pa]
    double total = 0.0;    ///< axial + bending [Pa]
    double ratio = 0.0;    ///< total / sigma_lim
};

/**
 * @brief A member failure recorded in the run's failure log
 */
struct FailureEvent {
    int member_id = -1;
    int step = 0;
    double stress_ratio = 0.0;
    double load_factor = 0.0;
};

/**
 * @brief Peak combined stress of a member
 *
 * σ_max = |N|/A + M_max·c/I with M_max the larger resultant end moment.
 * N is taken as the larger magnitude of the two end values.
 */
MemberStress member_stress(const Member& member, const MemberResponse& response);

/**
 * @brief Selects and removes overstressed members
 */
class FailureDetector {
public:
    explicit FailureDetector(FailureConfig config = FailureConfig{});

    /**
     * @brief Find members failing at this step
     *
     * Only active members with a response are considered. With the single
     * policy at most one event is returned; ties go to the lowest member ID.
     * With the all policy events are in ascending member ID order.
     *
     * @return Failure events (empty if nothing is overstressed)
     */
    std::vector<FailureEvent> evaluate(const FrameData& frame,
                                       const std::vector<MemberResponse>& responses,
                                       int step, double load_factor) const;

    /**
     * @brief Deactivate failed members and stamp their failure order
     * @param frame Frame to modify
     * @param events Events from evaluate()
     * @param failures_so_far Number of members already in the failure log
     * @throws std::out_of_range if an event names an unknown member
     */
    void apply(FrameData& frame, const std::vector<FailureEvent>& events,
               int failures_so_far) const;

    const FailureConfig& config() const { return config_; }

private:
    FailureConfig config_;
};

} // namespace collapsex
