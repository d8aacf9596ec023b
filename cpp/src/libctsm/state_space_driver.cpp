#include "libctsm/state_space_driver.hpp"

#include "libctsm/errors.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace libctsm {

namespace {

constexpr double kBoundTolerance = 1e-6;
constexpr double kHessianStep = 1e-4;
constexpr double kMinHessianStep = 1e-8;

// Second differences of the objective over the listed parameters. Steps shrink
// near a bound so every trial point stays inside the box.
Eigen::MatrixXd compute_hessian(const ObjectiveFunction& objective,
                                const std::vector<double>& parameters,
                                const std::vector<std::size_t>& indices,
                                const std::vector<double>& steps) {
    const std::size_t k = indices.size();
    Eigen::MatrixXd hessian(k, k);
    std::vector<double> x = parameters;
    const double f0 = objective.value(x);

    for (std::size_t a = 0; a < k; ++a) {
        const std::size_t i = indices[a];
        const double hi = steps[a];
        x[i] = parameters[i] + hi;
        const double f_plus = objective.value(x);
        x[i] = parameters[i] - hi;
        const double f_minus = objective.value(x);
        x[i] = parameters[i];
        hessian(a, a) = (f_plus - 2.0 * f0 + f_minus) / (hi * hi);

        for (std::size_t b = 0; b < a; ++b) {
            const std::size_t j = indices[b];
            const double hj = steps[b];
            double sum = 0.0;
            for (int si : {1, -1}) {
                for (int sj : {1, -1}) {
                    x[i] = parameters[i] + si * hi;
                    x[j] = parameters[j] + sj * hj;
                    sum += si * sj * objective.value(x);
                }
            }
            x[i] = parameters[i];
            x[j] = parameters[j];
            hessian(a, b) = hessian(b, a) = sum / (4.0 * hi * hj);
        }
    }
    return hessian;
}

}  // namespace

StateSpaceDriver::StateSpaceDriver(ObjectiveOptions objective_options) : objective_options_(objective_options) {}

const ObjectiveOptions& StateSpaceDriver::objective_options() const noexcept {
    return objective_options_;
}

FitResult StateSpaceDriver::fit(const ModelSpec& model,
                                const WideTable& table,
                                const OptimizationOptions& options,
                                const std::string& optimizer_name) const {
    return fit(model, build_panel(table), options, optimizer_name);
}

FitResult StateSpaceDriver::fit(const ModelSpec& model,
                                const std::vector<SubjectSeries>& series,
                                const OptimizationOptions& options,
                                const std::string& optimizer_name) const {
    ObjectiveOptions objective_options = objective_options_;
    objective_options.verbose = objective_options.verbose || options.verbose;
    MultiSubjectObjective objective(model, series, objective_options);
    auto optimizer = make_optimizer(optimizer_name);

    const Bounds bounds = objective.bounds();
    OptimizationResult result = optimizer->optimize(objective, objective.initial_parameters(), bounds, options);

    FitResult fit_result;
    fit_result.parameter_names = objective.parameter_names();
    fit_result.estimates = result.parameters;
    fit_result.objective_value = result.objective_value;
    fit_result.log_likelihood = -result.objective_value;
    fit_result.converged = result.converged;
    fit_result.status = result.status;
    fit_result.n_subjects = series.size();
    fit_result.n_observations = objective.observation_count();
    fit_result.at_bound = model.catalog().at_bounds(result.parameters, kBoundTolerance);

    if (options.verbose) {
        std::cout << "[" << optimizer->name() << "] " << to_string(result.status) << " after " << result.iterations
                  << " iterations, -logLik = " << result.objective_value << std::endl;
    }

    try {
        SubjectEvaluation evaluation = objective.evaluate_subjects(result.parameters);
        fit_result.subject_log_likelihoods = std::move(evaluation.log_likelihoods);
        fit_result.terminal_states = std::move(evaluation.terminal_states);
        fit_result.log_likelihood = evaluation.total_log_likelihood;
    } catch (const DegenerateLikelihood& e) {
        if (options.verbose) {
            std::cerr << "StateSpaceDriver: estimates are degenerate: " << e.what() << std::endl;
        }
    }

    // Compute AIC/BIC regardless of convergence status (using final values)
    const std::size_t n = result.parameters.size();
    const double k = static_cast<double>(n);
    fit_result.aic = 2.0 * k - 2.0 * fit_result.log_likelihood;
    if (fit_result.n_observations > 0) {
        fit_result.bic = k * std::log(static_cast<double>(fit_result.n_observations)) - 2.0 * fit_result.log_likelihood;
    }

    fit_result.standard_errors.assign(n, std::numeric_limits<double>::quiet_NaN());
    fit_result.vcov.assign(n * n, std::numeric_limits<double>::quiet_NaN());
    fit_result.on_constraint.assign(n, false);

    if (result.converged) {
        const std::vector<double>& lower = bounds.lower;
        const std::vector<double>& upper = bounds.upper;
        std::vector<std::size_t> interior;
        std::vector<double> steps;
        for (std::size_t i = 0; i < n; ++i) {
            if (fit_result.at_bound[i]) {
                continue;
            }
            const double x = result.parameters[i];
            const double room = std::min(x - lower[i], upper[i] - x);
            const double h = std::min(kHessianStep * std::max(1.0, std::abs(x)), 0.5 * room);
            if (h < kMinHessianStep) {
                continue;
            }
            // An infeasible trial point pins the parameter to the covariance constraint.
            const std::size_t penalties_before = objective.degenerate_evaluations();
            std::vector<double> trial = result.parameters;
            trial[i] = x + h;
            (void)objective.value(trial);
            trial[i] = x - h;
            (void)objective.value(trial);
            if (objective.degenerate_evaluations() != penalties_before) {
                fit_result.on_constraint[i] = true;
                continue;
            }
            interior.push_back(i);
            steps.push_back(h);
        }

        if (!interior.empty()) {
            const std::size_t penalties_before = objective.degenerate_evaluations();
            const Eigen::MatrixXd hessian = compute_hessian(objective, result.parameters, interior, steps);
            Eigen::LLT<Eigen::MatrixXd> llt(hessian);
            if (objective.degenerate_evaluations() != penalties_before || !hessian.allFinite() ||
                llt.info() != Eigen::Success) {
                if (options.verbose) {
                    std::cerr << "StateSpaceDriver: Hessian is not positive definite, standard errors unavailable"
                              << std::endl;
                }
            } else {
                // Hessian of NLL is Fisher Information. Covariance is Inverse.
                const Eigen::MatrixXd covariance =
                    llt.solve(Eigen::MatrixXd::Identity(hessian.rows(), hessian.cols()));
                Eigen::Map<Eigen::MatrixXd> vcov(fit_result.vcov.data(), n, n);
                for (std::size_t a = 0; a < interior.size(); ++a) {
                    for (std::size_t b = 0; b < interior.size(); ++b) {
                        vcov(interior[a], interior[b]) = covariance(a, b);
                    }
                    const double var = covariance(a, a);
                    fit_result.standard_errors[interior[a]] =
                        (var > 0) ? std::sqrt(var) : std::numeric_limits<double>::quiet_NaN();
                }
            }
        }
    }

    fit_result.degenerate_evaluations = objective.degenerate_evaluations();
    fit_result.optimization_result = std::move(result);
    return fit_result;
}

void require_converged(const FitResult& result) {
    if (!result.converged) {
        throw NonConvergence("estimation did not converge: " + to_string(result.status) + " after " +
                             std::to_string(result.optimization_result.iterations) + " iterations");
    }
}

}  // namespace libctsm
