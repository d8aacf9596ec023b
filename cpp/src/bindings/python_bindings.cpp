#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "libctsm/errors.hpp"
#include "libctsm/kalman_filter.hpp"
#include "libctsm/model_spec.hpp"
#include "libctsm/optimizer.hpp"
#include "libctsm/state_space_driver.hpp"
#include "libctsm/time_series_builder.hpp"

#include <limits>

namespace py = pybind11;
using namespace libctsm;

PYBIND11_MODULE(_libctsm, m) {
    m.doc() = "libctsm python bindings";

    py::register_exception<InvalidRecord>(m, "InvalidRecord", PyExc_ValueError);
    py::register_exception<DegenerateLikelihood>(m, "DegenerateLikelihood", PyExc_RuntimeError);
    py::register_exception<NonConvergence>(m, "NonConvergence", PyExc_RuntimeError);

    m.attr("MISSING") = kMissing;

    py::enum_<MatrixId>(m, "MatrixId")
        .value("A", MatrixId::A)
        .value("B", MatrixId::B)
        .value("C", MatrixId::C)
        .value("D", MatrixId::D)
        .value("Q", MatrixId::Q)
        .value("R", MatrixId::R)
        .value("X0", MatrixId::X0)
        .value("P0", MatrixId::P0)
        .value("U", MatrixId::U)
        .export_values();

    py::enum_<OptimizationStatus>(m, "OptimizationStatus")
        .value("Converged", OptimizationStatus::Converged)
        .value("IterationLimit", OptimizationStatus::IterationLimit)
        .value("TimeLimit", OptimizationStatus::TimeLimit)
        .export_values();

    py::class_<Observation>(m, "Observation")
        .def(py::init<>())
        .def_readwrite("time", &Observation::time)
        .def_readwrite("value", &Observation::value)
        .def_readwrite("occasion", &Observation::occasion);

    py::class_<SubjectSeries>(m, "SubjectSeries")
        .def(py::init<>())
        .def_readwrite("id", &SubjectSeries::id)
        .def_readwrite("observations", &SubjectSeries::observations)
        .def("__len__", &SubjectSeries::size);

    py::class_<FilterState>(m, "FilterState")
        .def(py::init<>())
        .def_readwrite("mean", &FilterState::mean)
        .def_readwrite("covariance", &FilterState::covariance)
        .def_readwrite("time", &FilterState::time);

    py::class_<WideTable>(m, "WideTable")
        .def(py::init<>())
        .def_readwrite("ids", &WideTable::ids)
        .def_readwrite("values", &WideTable::values)
        .def_readwrite("ages", &WideTable::ages);

    m.def("build_subject_series", &build_subject_series, py::arg("id"), py::arg("values"), py::arg("ages"));
    m.def("build_panel", &build_panel, py::arg("table"));

    py::class_<ModelSpec>(m, "ModelSpec")
        .def_property_readonly("parameter_names", &ModelSpec::parameter_names)
        .def_property_readonly("initial_parameters", &ModelSpec::initial_parameters)
        .def_property_readonly("initial_time", &ModelSpec::initial_time)
        .def("is_free", &ModelSpec::is_free, py::arg("matrix"), py::arg("row"), py::arg("col"));

    py::class_<ModelSpecBuilder>(m, "ModelSpecBuilder")
        .def(py::init<std::size_t, std::size_t, std::size_t>(),
             py::arg("latent_dimension"), py::arg("observed_dimension"), py::arg("input_dimension") = 1)
        .def("set_fixed", &ModelSpecBuilder::set_fixed)
        .def("set_free", &ModelSpecBuilder::set_free)
        .def("register_parameter", &ModelSpecBuilder::register_parameter,
             py::arg("id"), py::arg("initial_value"),
             py::arg("lower_bound") = -std::numeric_limits<double>::infinity(),
             py::arg("upper_bound") = std::numeric_limits<double>::infinity())
        .def("set_parameter_initial_value", &ModelSpecBuilder::set_parameter_initial_value)
        .def("set_initial_time", &ModelSpecBuilder::set_initial_time)
        .def("build", &ModelSpecBuilder::build);

    py::class_<LinearGrowthOptions>(m, "LinearGrowthOptions")
        .def(py::init<>())
        .def_readwrite("drift", &LinearGrowthOptions::drift)
        .def_readwrite("drift_lower", &LinearGrowthOptions::drift_lower)
        .def_readwrite("drift_upper", &LinearGrowthOptions::drift_upper)
        .def_readwrite("intercept_mean", &LinearGrowthOptions::intercept_mean)
        .def_readwrite("slope_mean", &LinearGrowthOptions::slope_mean)
        .def_readwrite("intercept_variance", &LinearGrowthOptions::intercept_variance)
        .def_readwrite("intercept_slope_covariance", &LinearGrowthOptions::intercept_slope_covariance)
        .def_readwrite("slope_variance", &LinearGrowthOptions::slope_variance)
        .def_readwrite("measurement_variance", &LinearGrowthOptions::measurement_variance)
        .def_readwrite("initial_time", &LinearGrowthOptions::initial_time);

    m.def("make_linear_growth_model", &make_linear_growth_model, py::arg("options") = LinearGrowthOptions());

    py::class_<OptimizationOptions>(m, "OptimizationOptions")
        .def(py::init<>())
        .def_readwrite("max_iterations", &OptimizationOptions::max_iterations)
        .def_readwrite("tolerance", &OptimizationOptions::tolerance)
        .def_readwrite("learning_rate", &OptimizationOptions::learning_rate)
        .def_readwrite("max_seconds", &OptimizationOptions::max_seconds)
        .def_readwrite("m", &OptimizationOptions::m)
        .def_readwrite("past", &OptimizationOptions::past)
        .def_readwrite("delta", &OptimizationOptions::delta)
        .def_readwrite("max_linesearch", &OptimizationOptions::max_linesearch)
        .def_readwrite("verbose", &OptimizationOptions::verbose);

    py::class_<ObjectiveOptions>(m, "ObjectiveOptions")
        .def(py::init<>())
        .def_readwrite("num_threads", &ObjectiveOptions::num_threads)
        .def_readwrite("degenerate_penalty", &ObjectiveOptions::degenerate_penalty)
        .def_readwrite("finite_difference_step", &ObjectiveOptions::finite_difference_step)
        .def_readwrite("verbose", &ObjectiveOptions::verbose);

    py::class_<OptimizationResult>(m, "OptimizationResult")
        .def(py::init<>())
        .def_readwrite("parameters", &OptimizationResult::parameters)
        .def_readwrite("objective_value", &OptimizationResult::objective_value)
        .def_readwrite("gradient_norm", &OptimizationResult::gradient_norm)
        .def_readwrite("iterations", &OptimizationResult::iterations)
        .def_readwrite("converged", &OptimizationResult::converged)
        .def_readwrite("status", &OptimizationResult::status)
        .def_readwrite("message", &OptimizationResult::message);

    py::class_<FitResult>(m, "FitResult")
        .def(py::init<>())
        .def_readwrite("optimization_result", &FitResult::optimization_result)
        .def_readwrite("parameter_names", &FitResult::parameter_names)
        .def_readwrite("estimates", &FitResult::estimates)
        .def_readwrite("standard_errors", &FitResult::standard_errors)
        .def_readwrite("vcov", &FitResult::vcov)
        .def_readwrite("at_bound", &FitResult::at_bound)
        .def_readwrite("on_constraint", &FitResult::on_constraint)
        .def_readwrite("objective_value", &FitResult::objective_value)
        .def_readwrite("log_likelihood", &FitResult::log_likelihood)
        .def_readwrite("aic", &FitResult::aic)
        .def_readwrite("bic", &FitResult::bic)
        .def_readwrite("n_subjects", &FitResult::n_subjects)
        .def_readwrite("n_observations", &FitResult::n_observations)
        .def_readwrite("subject_log_likelihoods", &FitResult::subject_log_likelihoods)
        .def_readwrite("terminal_states", &FitResult::terminal_states)
        .def_readwrite("degenerate_evaluations", &FitResult::degenerate_evaluations)
        .def_readwrite("converged", &FitResult::converged)
        .def_readwrite("status", &FitResult::status);

    m.def("require_converged", &require_converged, py::arg("result"));

    py::class_<StateSpaceDriver>(m, "StateSpaceDriver")
        .def(py::init<ObjectiveOptions>(), py::arg("objective_options") = ObjectiveOptions())
        .def("fit",
             py::overload_cast<const ModelSpec&, const std::vector<SubjectSeries>&, const OptimizationOptions&,
                               const std::string&>(&StateSpaceDriver::fit, py::const_),
             py::arg("model"),
             py::arg("series"),
             py::arg("options") = OptimizationOptions(),
             py::arg("optimizer_name") = "lbfgsb")
        .def("fit_table",
             py::overload_cast<const ModelSpec&, const WideTable&, const OptimizationOptions&, const std::string&>(
                 &StateSpaceDriver::fit, py::const_),
             py::arg("model"),
             py::arg("table"),
             py::arg("options") = OptimizationOptions(),
             py::arg("optimizer_name") = "lbfgsb");
}
