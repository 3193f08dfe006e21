#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "collapsex/node.hpp"
#include "collapsex/material.hpp"
#include "collapsex/section.hpp"
#include "collapsex/member.hpp"
#include "collapsex/frame_data.hpp"
#include "collapsex/errors.hpp"
#include "collapsex/warnings.hpp"
#include "collapsex/logger.hpp"
#include "collapsex/solver.hpp"
#include "collapsex/failure.hpp"
#include "collapsex/redistribution.hpp"
#include "collapsex/entropy.hpp"
#include "collapsex/collapse_detector.hpp"
#include "collapsex/simulation.hpp"

#include <stdexcept>

namespace py = pybind11;

namespace {

collapsex::Node& node_or_throw(collapsex::FrameData& frame, int node_id) {
    int idx = frame.node_index(node_id);
    if (idx < 0) {
        throw py::index_error("Node " + std::to_string(node_id) + " not found");
    }
    return frame.nodes[idx];
}

}  // namespace

/**
 * collapsex C++ Python bindings module.
 * Exposes model building, run configuration and run results so that an
 * external reporting or visualisation layer can consume them.
 */
PYBIND11_MODULE(_collapsex_cpp, m) {
    m.doc() = "collapsex C++ core module - entropy-based progressive collapse analysis";

    m.attr("__version__") = "0.1.0";

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::register_exception<collapsex::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<collapsex::NumericError>(m, "NumericError", PyExc_ArithmeticError);

    py::enum_<collapsex::WarningCode>(m, "WarningCode")
        .value("NEGATIVE_STRAIN_ENERGY", collapsex::WarningCode::NEGATIVE_STRAIN_ENERGY)
        .value("NEAR_SINGULARITY", collapsex::WarningCode::NEAR_SINGULARITY)
        .value("ZERO_TOTAL_ENERGY", collapsex::WarningCode::ZERO_TOTAL_ENERGY)
        .value("ENERGY_LOST_NO_RECEIVER", collapsex::WarningCode::ENERGY_LOST_NO_RECEIVER)
        .value("NO_SURVIVING_NEIGHBOUR", collapsex::WarningCode::NO_SURVIVING_NEIGHBOUR);

    py::class_<collapsex::CollapsexWarning>(m, "Warning", "Recoverable numeric anomaly")
        .def_readonly("code", &collapsex::CollapsexWarning::code)
        .def_readonly("message", &collapsex::CollapsexWarning::message)
        .def_readonly("step", &collapsex::CollapsexWarning::step)
        .def_readonly("involved_members", &collapsex::CollapsexWarning::involved_members)
        .def_readonly("details", &collapsex::CollapsexWarning::details)
        .def("__str__", &collapsex::CollapsexWarning::to_string);

    m.def("set_log_level",
          py::overload_cast<const std::string&>(&collapsex::set_log_level),
          py::arg("level"),
          "Set the collapsex log level ('trace', 'debug', 'info', 'warn', 'err', 'off')");

    // ========================================================================
    // Structural model
    // ========================================================================

    py::enum_<collapsex::DOFIndex>(m, "DOFIndex")
        .value("UX", collapsex::UX)
        .value("UY", collapsex::UY)
        .value("UZ", collapsex::UZ)
        .value("RX", collapsex::RX)
        .value("RY", collapsex::RY)
        .value("RZ", collapsex::RZ)
        .export_values();

    py::class_<collapsex::Material, std::shared_ptr<collapsex::Material>>(m, "Material",
        "Linear elastic material with a stress limit")
        .def(py::init<int, std::string, double, double, double>(),
             py::arg("id"), py::arg("name"), py::arg("E"), py::arg("sigma_lim"),
             py::arg("rho") = 7850.0)
        .def_readwrite("id", &collapsex::Material::id, "Material ID")
        .def_readwrite("name", &collapsex::Material::name, "Material name")
        .def_readwrite("E", &collapsex::Material::E, "Young's modulus [Pa]")
        .def_readwrite("sigma_lim", &collapsex::Material::sigma_lim, "Stress limit [Pa]")
        .def_readwrite("rho", &collapsex::Material::rho, "Density [kg/m³]")
        .def_static("steel_s275", &collapsex::Material::steel_s275, py::arg("id"))
        .def_static("steel_s355", &collapsex::Material::steel_s355, py::arg("id"));

    py::class_<collapsex::Section, std::shared_ptr<collapsex::Section>>(m, "Section",
        "Cross-section properties")
        .def(py::init<int, std::string, double, double, double>(),
             py::arg("id"), py::arg("name"), py::arg("A"), py::arg("I"), py::arg("c"))
        .def_readwrite("id", &collapsex::Section::id, "Section ID")
        .def_readwrite("name", &collapsex::Section::name, "Section name")
        .def_readwrite("A", &collapsex::Section::A, "Cross-sectional area [m²]")
        .def_readwrite("I", &collapsex::Section::I, "Second moment of area [m⁴]")
        .def_readwrite("c", &collapsex::Section::c, "Extreme fibre distance [m]")
        .def_static("compact", &collapsex::Section::compact,
                    py::arg("id"), py::arg("name"), py::arg("A"), py::arg("I"))
        .def("section_modulus", &collapsex::Section::section_modulus);

    py::class_<collapsex::Node>(m, "Node", "Frame node with 6 DOFs")
        .def_readonly("id", &collapsex::Node::id)
        .def_readonly("x", &collapsex::Node::x)
        .def_readonly("y", &collapsex::Node::y)
        .def_readonly("z", &collapsex::Node::z)
        .def_readonly("fixed", &collapsex::Node::fixed, "Fixed flags [UX, UY, UZ, RX, RY, RZ]")
        .def("is_fixed", &collapsex::Node::is_fixed, py::arg("dof"));

    py::class_<collapsex::Member>(m, "Member", "Frame member between two nodes")
        .def_readonly("id", &collapsex::Member::id)
        .def_readonly("node_i", &collapsex::Member::node_i)
        .def_readonly("node_j", &collapsex::Member::node_j)
        .def_readonly("active", &collapsex::Member::active)
        .def_readonly("failure_order", &collapsex::Member::failure_order);

    py::class_<collapsex::FrameData>(m, "FrameData", "Complete structural model of a frame")
        .def(py::init<std::string>(), py::arg("name") = "")
        .def_readwrite("name", &collapsex::FrameData::name)
        .def_readonly("nodes", &collapsex::FrameData::nodes)
        .def_readonly("members", &collapsex::FrameData::members)
        .def("add_node",
             [](collapsex::FrameData& f, int id, double x, double y, double z) {
                 f.add_node(id, x, y, z);
             },
             py::arg("id"), py::arg("x"), py::arg("y"), py::arg("z") = 0.0)
        .def("fix_node",
             [](collapsex::FrameData& f, int node_id) { node_or_throw(f, node_id).fix_all(); },
             py::arg("node_id"), "Restrain all 6 DOFs of a node")
        .def("pin_node",
             [](collapsex::FrameData& f, int node_id) { node_or_throw(f, node_id).pin(); },
             py::arg("node_id"), "Restrain the translations of a node")
        .def("fix_dof",
             [](collapsex::FrameData& f, int node_id, int dof) {
                 node_or_throw(f, node_id).fix_dof(dof);
             },
             py::arg("node_id"), py::arg("dof"))
        .def("add_member",
             [](collapsex::FrameData& f, int id, int node_i, int node_j,
                std::shared_ptr<collapsex::Material> material,
                std::shared_ptr<collapsex::Section> section) {
                 f.add_member(id, node_i, node_j, material, section);
             },
             py::arg("id"), py::arg("node_i"), py::arg("node_j"),
             py::arg("material"), py::arg("section"))
        .def("add_load", &collapsex::FrameData::add_load,
             py::arg("node_id"), py::arg("dof"), py::arg("magnitude"))
        .def("num_nodes", &collapsex::FrameData::num_nodes)
        .def("num_members", &collapsex::FrameData::num_members)
        .def("num_dofs", &collapsex::FrameData::num_dofs)
        .def("adjacent_members", &collapsex::FrameData::adjacent_members,
             py::arg("member_id"), py::arg("active_only") = true)
        .def("validate", &collapsex::FrameData::validate);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::enum_<collapsex::FailurePolicy>(m, "FailurePolicy")
        .value("SingleMostOverstressed", collapsex::FailurePolicy::SingleMostOverstressed)
        .value("AllOverstressed", collapsex::FailurePolicy::AllOverstressed);

    py::enum_<collapsex::DetectionMethod>(m, "DetectionMethod")
        .value("ZScore", collapsex::DetectionMethod::ZScore)
        .value("Threshold", collapsex::DetectionMethod::Threshold);

    m.def("parse_detection_method", &collapsex::parse_detection_method, py::arg("name"));

    py::enum_<collapsex::LinearSolver::Method>(m, "SolverMethod")
        .value("SimplicialLDLT", collapsex::LinearSolver::Method::SimplicialLDLT)
        .value("SparseLU", collapsex::LinearSolver::Method::SparseLU);

    py::class_<collapsex::SolverSettings>(m, "SolverSettings")
        .def(py::init<>())
        .def_readwrite("pivot_tolerance", &collapsex::SolverSettings::pivot_tolerance)
        .def_readwrite("conditioning_warning", &collapsex::SolverSettings::conditioning_warning)
        .def_readwrite("residual_tolerance", &collapsex::SolverSettings::residual_tolerance);

    py::class_<collapsex::FailureConfig>(m, "FailureConfig")
        .def(py::init<>())
        .def_readwrite("policy", &collapsex::FailureConfig::policy)
        .def_readwrite("tie_tolerance", &collapsex::FailureConfig::tie_tolerance);

    py::class_<collapsex::RedistributionConfig>(m, "RedistributionConfig")
        .def(py::init<>())
        .def_readwrite("dissipation_fraction", &collapsex::RedistributionConfig::dissipation_fraction)
        .def_readwrite("conservation_tolerance",
                       &collapsex::RedistributionConfig::conservation_tolerance);

    py::class_<collapsex::DetectorConfig>(m, "DetectorConfig")
        .def(py::init<>())
        .def_readwrite("method", &collapsex::DetectorConfig::method)
        .def_readwrite("window", &collapsex::DetectorConfig::window)
        .def_readwrite("n_sigma", &collapsex::DetectorConfig::n_sigma)
        .def_readwrite("min_sigma", &collapsex::DetectorConfig::min_sigma)
        .def_readwrite("threshold", &collapsex::DetectorConfig::threshold);

    py::class_<collapsex::SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("max_steps", &collapsex::SimulationConfig::max_steps)
        .def_readwrite("initial_load_factor", &collapsex::SimulationConfig::initial_load_factor)
        .def_readwrite("load_step", &collapsex::SimulationConfig::load_step)
        .def_readwrite("detector", &collapsex::SimulationConfig::detector)
        .def_readwrite("failure", &collapsex::SimulationConfig::failure)
        .def_readwrite("redistribution", &collapsex::SimulationConfig::redistribution)
        .def_readwrite("solver", &collapsex::SimulationConfig::solver)
        .def_readwrite("solver_method", &collapsex::SimulationConfig::solver_method)
        .def_readwrite("energy_tolerance", &collapsex::SimulationConfig::energy_tolerance)
        .def_readwrite("stop_when_all_failed", &collapsex::SimulationConfig::stop_when_all_failed)
        .def("validate", &collapsex::SimulationConfig::validate);

    // ========================================================================
    // Results
    // ========================================================================

    py::class_<collapsex::FailureEvent>(m, "FailureEvent")
        .def_readonly("member_id", &collapsex::FailureEvent::member_id)
        .def_readonly("step", &collapsex::FailureEvent::step)
        .def_readonly("stress_ratio", &collapsex::FailureEvent::stress_ratio)
        .def_readonly("load_factor", &collapsex::FailureEvent::load_factor);

    py::class_<collapsex::StepRecord>(m, "StepRecord")
        .def_readonly("step", &collapsex::StepRecord::step)
        .def_readonly("load_factor", &collapsex::StepRecord::load_factor)
        .def_readonly("displacements", &collapsex::StepRecord::displacements)
        .def_readonly("strain_energy", &collapsex::StepRecord::strain_energy)
        .def_readonly("entropy", &collapsex::StepRecord::entropy)
        .def_readonly("entropy_rate", &collapsex::StepRecord::entropy_rate)
        .def_readonly("normalized_entropy", &collapsex::StepRecord::normalized_entropy)
        .def_readonly("gini", &collapsex::StepRecord::gini)
        .def_readonly("total_energy", &collapsex::StepRecord::total_energy)
        .def_readonly("active_members", &collapsex::StepRecord::active_members)
        .def_readonly("newly_failed", &collapsex::StepRecord::newly_failed)
        .def_readonly("top_localized", &collapsex::StepRecord::top_localized);

    py::enum_<collapsex::CollapseCause>(m, "CollapseCause")
        .value("StructuralSingularity", collapsex::CollapseCause::StructuralSingularity)
        .value("EntropyDetection", collapsex::CollapseCause::EntropyDetection)
        .value("AllMembersFailed", collapsex::CollapseCause::AllMembersFailed);

    py::class_<collapsex::Outcome>(m, "Outcome")
        .def_property_readonly("collapsed", &collapsex::Outcome::collapsed)
        .def_readonly("step", &collapsex::Outcome::step)
        .def_readonly("cause", &collapsex::Outcome::cause)
        .def_readonly("load_factor", &collapsex::Outcome::load_factor)
        .def_readonly("active_members", &collapsex::Outcome::active_members)
        .def_readonly("message", &collapsex::Outcome::message)
        .def("__str__", &collapsex::Outcome::to_string);

    py::class_<collapsex::SimulationResult>(m, "SimulationResult")
        .def_readonly("steps", &collapsex::SimulationResult::steps)
        .def_readonly("failure_log", &collapsex::SimulationResult::failure_log)
        .def_readonly("outcome", &collapsex::SimulationResult::outcome)
        .def_property_readonly("warnings",
            [](const collapsex::SimulationResult& r) { return r.warnings.warnings; })
        .def("failed_sequence", &collapsex::SimulationResult::failed_sequence)
        .def("summary", &collapsex::SimulationResult::summary);

    m.def("run",
          py::overload_cast<const collapsex::FrameData&, const collapsex::SimulationConfig&>(
              &collapsex::run),
          py::arg("frame"), py::arg("config") = collapsex::SimulationConfig{},
          py::call_guard<py::gil_scoped_release>(),
          "Run a progressive-collapse simulation on a copy of the frame");

    m.def("run_method",
          py::overload_cast<const collapsex::FrameData&, const std::string&,
                            collapsex::SimulationConfig>(&collapsex::run),
          py::arg("frame"), py::arg("method"),
          py::arg("config") = collapsex::SimulationConfig{},
          "Run with the collapse detector selected by name ('zscore' or 'threshold')");
}
