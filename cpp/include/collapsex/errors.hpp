/**
 * @file errors.hpp
 * @brief Structured error handling for collapsex.
 *
 * Defines error codes, a structured error record and the two exception
 * types thrown by the library. A structure becoming singular during a
 * run is not an error: it is reported through the solver result flags
 * and ends the simulation with a collapse outcome.
 */

#ifndef COLLAPSEX_ERRORS_HPP
#define COLLAPSEX_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace collapsex {

/**
 * @brief Error codes for collapsex failures.
 *
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Configuration Errors (100-199) ===

    /// Unknown collapse-detection method name
    UNKNOWN_DETECTION_METHOD = 100,

    /// Simulation or component parameter out of range
    INVALID_PARAMETER = 101,

    // === Element Errors (200-299) ===

    /// Invalid member definition (e.g., zero length)
    INVALID_MEMBER = 200,

    /// Member has invalid or missing material
    INVALID_MATERIAL = 201,

    /// Member has invalid or missing section
    INVALID_SECTION = 202,

    /// Member references non-existent node
    INVALID_NODE_REFERENCE = 203,

    /// Duplicate node or member identifier
    DUPLICATE_ID = 204,

    // === Load Errors (300-399) ===

    /// Load references non-existent node
    INVALID_LOAD_NODE = 300,

    /// Load DOF index outside [0, 5]
    INVALID_LOAD_DOF = 301,

    /// Nonzero load applied at a fixed DOF
    LOAD_AT_FIXED_DOF = 302,

    // === Model Errors (400-499) ===

    /// Model has no members
    EMPTY_MODEL = 400,

    /// Model has no nodes
    NO_NODES = 401,

    // === Numeric Errors (500-599) ===

    /// Energy conservation violated during redistribution
    ENERGY_NOT_CONSERVED = 500,

    /// Non-finite value produced by a numeric step
    NUMERICAL_OVERFLOW = 501,

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::UNKNOWN_DETECTION_METHOD: return "UNKNOWN_DETECTION_METHOD";
        case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorCode::INVALID_MEMBER: return "INVALID_MEMBER";
        case ErrorCode::INVALID_MATERIAL: return "INVALID_MATERIAL";
        case ErrorCode::INVALID_SECTION: return "INVALID_SECTION";
        case ErrorCode::INVALID_NODE_REFERENCE: return "INVALID_NODE_REFERENCE";
        case ErrorCode::DUPLICATE_ID: return "DUPLICATE_ID";
        case ErrorCode::INVALID_LOAD_NODE: return "INVALID_LOAD_NODE";
        case ErrorCode::INVALID_LOAD_DOF: return "INVALID_LOAD_DOF";
        case ErrorCode::LOAD_AT_FIXED_DOF: return "LOAD_AT_FIXED_DOF";
        case ErrorCode::EMPTY_MODEL: return "EMPTY_MODEL";
        case ErrorCode::NO_NODES: return "NO_NODES";
        case ErrorCode::ENERGY_NOT_CONSERVED: return "ENERGY_NOT_CONSERVED";
        case ErrorCode::NUMERICAL_OVERFLOW: return "NUMERICAL_OVERFLOW";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information.
 *
 * Contains a machine-readable error code, a human-readable message,
 * and the nodes, members and DOFs involved.
 */
struct CollapsexError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Global DOF indices involved in the error
    std::vector<int> involved_dofs;

    /// Member IDs involved in the error
    std::vector<int> involved_members;

    /// Node IDs involved in the error
    std::vector<int> involved_nodes;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    CollapsexError()
        : code(ErrorCode::OK), message("OK") {}

    CollapsexError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_nodes.empty()) {
            result += "\n  Involved nodes: ";
            for (size_t i = 0; i < involved_nodes.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_nodes[i]);
            }
        }

        if (!involved_members.empty()) {
            result += "\n  Involved members: ";
            for (size_t i = 0; i < involved_members.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_members[i]);
            }
        }

        if (!involved_dofs.empty()) {
            result += "\n  Involved DOFs: ";
            for (size_t i = 0; i < involved_dofs.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_dofs[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    static CollapsexError invalid_node(int node_id, const std::string& context = "") {
        CollapsexError err(ErrorCode::INVALID_NODE_REFERENCE,
            "Invalid node reference" + (context.empty() ? "" : ": " + context));
        err.involved_nodes.push_back(node_id);
        return err;
    }

    static CollapsexError invalid_member(int member_id, const std::string& reason) {
        CollapsexError err(ErrorCode::INVALID_MEMBER, "Invalid member: " + reason);
        err.involved_members.push_back(member_id);
        return err;
    }

    static CollapsexError invalid_property(ErrorCode code, int member_id,
                                           const std::string& property, double value) {
        CollapsexError err(code, "Property '" + property + "' must be positive");
        err.involved_members.push_back(member_id);
        err.details["property"] = property;
        err.details["value"] = std::to_string(value);
        err.suggestion = "Check material and section property values and units.";
        return err;
    }

    static CollapsexError load_at_fixed_dof(int node_id, int dof, double magnitude) {
        CollapsexError err(ErrorCode::LOAD_AT_FIXED_DOF,
            "Nonzero load applied at a fixed degree of freedom");
        err.involved_nodes.push_back(node_id);
        err.details["dof"] = std::to_string(dof);
        err.details["magnitude"] = std::to_string(magnitude);
        err.suggestion = "Remove the load or release the DOF; loads at supports are "
                         "carried directly by the reaction.";
        return err;
    }

    static CollapsexError empty_model() {
        CollapsexError err(ErrorCode::EMPTY_MODEL, "Model has no members");
        err.suggestion = "Add at least one member to the frame.";
        return err;
    }

    static CollapsexError unknown_method(const std::string& name) {
        CollapsexError err(ErrorCode::UNKNOWN_DETECTION_METHOD,
            "Unknown collapse detection method: '" + name + "'");
        err.suggestion = "Use 'zscore' or 'threshold'.";
        return err;
    }

    static CollapsexError invalid_parameter(const std::string& name, const std::string& reason) {
        CollapsexError err(ErrorCode::INVALID_PARAMETER,
            "Invalid parameter '" + name + "': " + reason);
        err.details["parameter"] = name;
        return err;
    }
};

/**
 * @brief Thrown when a frame or run configuration is malformed.
 *
 * Raised at validation time, before any simulation step executes.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(CollapsexError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const CollapsexError& error() const { return error_; }

private:
    CollapsexError error_;
};

/**
 * @brief Thrown when a numeric invariant of the pipeline is broken.
 *
 * Indicates a defect rather than a structural outcome.
 */
class NumericError : public std::runtime_error {
public:
    explicit NumericError(CollapsexError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const CollapsexError& error() const { return error_; }

private:
    CollapsexError error_;
};

}  // namespace collapsex

#endif  // COLLAPSEX_ERRORS_HPP
