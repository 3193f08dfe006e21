/**
 * @file warnings.hpp
 * @brief Warnings for recoverable numeric anomalies during a run.
 *
 * Warnings indicate conditions handled by an explicit fallback policy
 * (clamping, zero entropy, dissipated energy) that do not stop the run
 * but should be visible to whoever consumes the results.
 */

#ifndef COLLAPSEX_WARNINGS_HPP
#define COLLAPSEX_WARNINGS_HPP

#include <map>
#include <string>
#include <vector>

namespace collapsex {

/**
 * @brief Warning codes for numeric anomalies.
 */
enum class WarningCode {
    // === Solver Warnings (100-199) ===

    /// Negative strain energy beyond tolerance, clamped to zero
    NEGATIVE_STRAIN_ENERGY = 100,

    /// Stiffness matrix is poorly conditioned but still solvable
    NEAR_SINGULARITY = 101,

    // === Entropy Warnings (200-299) ===

    /// Total strain energy is zero; entropy defined as zero
    ZERO_TOTAL_ENERGY = 200,

    // === Redistribution Warnings (300-399) ===

    /// Energy of a failed member had no surviving receiver
    ENERGY_LOST_NO_RECEIVER = 300,

    /// Failed member had no surviving neighbour; energy spread globally
    NO_SURVIVING_NEIGHBOUR = 301
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    Low = 0,
    Medium = 1,
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::NEGATIVE_STRAIN_ENERGY: return "NEGATIVE_STRAIN_ENERGY";
        case WarningCode::NEAR_SINGULARITY: return "NEAR_SINGULARITY";
        case WarningCode::ZERO_TOTAL_ENERGY: return "ZERO_TOTAL_ENERGY";
        case WarningCode::ENERGY_LOST_NO_RECEIVER: return "ENERGY_LOST_NO_RECEIVER";
        case WarningCode::NO_SURVIVING_NEIGHBOUR: return "NO_SURVIVING_NEIGHBOUR";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning recorded during a run.
 */
struct CollapsexWarning {
    WarningCode code;               ///< Machine-readable warning code
    WarningSeverity severity;       ///< Severity level
    std::string message;            ///< Human-readable message
    int step = -1;                  ///< Simulation step (-1 if not step-bound)
    std::vector<int> involved_members;  ///< Member IDs involved
    std::map<std::string, std::string> details;  ///< Extra diagnostics

    CollapsexWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (step >= 0) {
            result += " (step " + std::to_string(step) + ")";
        }

        if (!involved_members.empty()) {
            result += "\n  Members: ";
            for (size_t i = 0; i < involved_members.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_members[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        return result;
    }

    // === Factory methods ===

    static CollapsexWarning negative_strain_energy(int member_id, double energy) {
        CollapsexWarning warn(WarningCode::NEGATIVE_STRAIN_ENERGY, WarningSeverity::High,
            "Negative strain energy clamped to zero");
        warn.involved_members.push_back(member_id);
        warn.details["strain_energy"] = std::to_string(energy);
        return warn;
    }

    static CollapsexWarning near_singularity(double pivot_ratio) {
        CollapsexWarning warn(WarningCode::NEAR_SINGULARITY, WarningSeverity::Medium,
            "Stiffness matrix is poorly conditioned");
        warn.details["pivot_ratio"] = std::to_string(pivot_ratio);
        return warn;
    }

    static CollapsexWarning zero_total_energy() {
        return CollapsexWarning(WarningCode::ZERO_TOTAL_ENERGY, WarningSeverity::Low,
            "Total strain energy is zero; entropy set to zero");
    }

    static CollapsexWarning energy_lost(int member_id, double energy) {
        CollapsexWarning warn(WarningCode::ENERGY_LOST_NO_RECEIVER, WarningSeverity::Medium,
            "No surviving member to receive redistributed energy");
        warn.involved_members.push_back(member_id);
        warn.details["energy"] = std::to_string(energy);
        return warn;
    }

    static CollapsexWarning no_surviving_neighbour(int member_id) {
        CollapsexWarning warn(WarningCode::NO_SURVIVING_NEIGHBOUR, WarningSeverity::Low,
            "Failed member has no surviving neighbour; energy spread over all survivors");
        warn.involved_members.push_back(member_id);
        return warn;
    }
};

/**
 * @brief Collection of warnings gathered during a run.
 */
class WarningList {
public:
    std::vector<CollapsexWarning> warnings;

    void add(const CollapsexWarning& warning) {
        warnings.push_back(warning);
    }

    void add(CollapsexWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    size_t count_by_code(WarningCode code) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.code == code) ++count;
        }
        return count;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    void clear() { warnings.clear(); }

    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace collapsex

#endif  // COLLAPSEX_WARNINGS_HPP
