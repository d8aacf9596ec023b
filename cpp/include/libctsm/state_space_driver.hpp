#pragma once

#include "libctsm/model_spec.hpp"
#include "libctsm/model_types.hpp"
#include "libctsm/multi_subject_objective.hpp"
#include "libctsm/optimizer.hpp"
#include "libctsm/time_series_builder.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace libctsm {

struct FitResult {
    OptimizationResult optimization_result;
    std::vector<std::string> parameter_names;
    std::vector<double> estimates;
    std::vector<double> standard_errors;  // NaN for parameters at a bound or on a constraint
    std::vector<double> vcov;             // Flattened n x n matrix
    std::vector<bool> at_bound;
    std::vector<bool> on_constraint;      // Hessian step leaves the feasible covariance region
    double objective_value{0.0};          // joint negative log-likelihood
    double log_likelihood{0.0};
    double aic{0.0};
    double bic{std::numeric_limits<double>::quiet_NaN()};
    std::size_t n_subjects{0};
    std::size_t n_observations{0};
    std::vector<double> subject_log_likelihoods;
    std::vector<FilterState> terminal_states;
    std::size_t degenerate_evaluations{0};
    bool converged{false};
    OptimizationStatus status{OptimizationStatus::IterationLimit};
};

/**
 * Maximum likelihood estimation of a continuous-time model over a panel of
 * subjects.
 *
 * The fit starts from the model's initial parameter values, respects the
 * catalog bounds, and reports a non-converged fit through FitResult::status
 * rather than by throwing.
 */
class StateSpaceDriver {
public:
    explicit StateSpaceDriver(ObjectiveOptions objective_options = ObjectiveOptions());

    [[nodiscard]] FitResult fit(const ModelSpec& model,
                                const std::vector<SubjectSeries>& series,
                                const OptimizationOptions& options = OptimizationOptions(),
                                const std::string& optimizer_name = "lbfgsb") const;

    // Builds the series from a wide table first.
    [[nodiscard]] FitResult fit(const ModelSpec& model,
                                const WideTable& table,
                                const OptimizationOptions& options = OptimizationOptions(),
                                const std::string& optimizer_name = "lbfgsb") const;

    [[nodiscard]] const ObjectiveOptions& objective_options() const noexcept;

private:
    ObjectiveOptions objective_options_;
};

// @throws NonConvergence unless result.converged.
void require_converged(const FitResult& result);

}  // namespace libctsm
