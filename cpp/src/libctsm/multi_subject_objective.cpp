#include "libctsm/multi_subject_objective.hpp"

#include "libctsm/errors.hpp"
#include "libctsm/time_series_builder.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace libctsm {

namespace {

int resolve_threads(int requested) {
#ifdef _OPENMP
    if (requested <= 0) {
        return std::max(1, omp_get_max_threads());
    }
    return std::max(1, std::min(requested, omp_get_max_threads()));
#else
    (void)requested;
    return 1;
#endif
}

bool positive_semidefinite(const Eigen::MatrixXd& matrix) {
    if (matrix.size() == 0) {
        return true;
    }
    if (!matrix.allFinite()) {
        return false;
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix, Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        return false;
    }
    const double scale = std::max(1.0, solver.eigenvalues().cwiseAbs().maxCoeff());
    return solver.eigenvalues().minCoeff() >= -1e-10 * scale;
}

}  // namespace

MultiSubjectObjective::MultiSubjectObjective(ModelSpec model,
                                             std::vector<SubjectSeries> series,
                                             ObjectiveOptions options)
    : model_(std::move(model)), series_(std::move(series)), options_(options) {
    if (model_.dimensions().observed != 1) {
        throw std::invalid_argument("multi-subject objective expects one observed variable");
    }
    if (!(options_.degenerate_penalty > 0.0) || !std::isfinite(options_.degenerate_penalty)) {
        throw std::invalid_argument("degenerate penalty must be positive and finite");
    }
    if (!(options_.finite_difference_step > 0.0)) {
        throw std::invalid_argument("finite difference step must be positive");
    }
    const double t0 = model_.initial_time();
    for (const auto& subject : series_) {
        if (!subject.empty() && subject.observations.front().time < t0) {
            throw std::invalid_argument("subject " + subject.id + " has an observation before the initial time " +
                                        std::to_string(t0));
        }
    }
    observation_count_ = total_observations(series_);
}

const std::vector<std::string>& MultiSubjectObjective::parameter_names() const noexcept {
    return model_.parameter_names();
}

std::vector<double> MultiSubjectObjective::initial_parameters() const {
    return model_.initial_parameters();
}

Bounds MultiSubjectObjective::bounds() const {
    return Bounds{model_.catalog().lower_bounds(), model_.catalog().upper_bounds()};
}

const ModelSpec& MultiSubjectObjective::model() const noexcept {
    return model_;
}

const std::vector<SubjectSeries>& MultiSubjectObjective::series() const noexcept {
    return series_;
}

std::size_t MultiSubjectObjective::observation_count() const noexcept {
    return observation_count_;
}

const ObjectiveOptions& MultiSubjectObjective::options() const noexcept {
    return options_;
}

std::size_t MultiSubjectObjective::degenerate_evaluations() const noexcept {
    return degenerate_count_.load();
}

MultiSubjectObjective::SubjectRun MultiSubjectObjective::run_subjects(const EvaluatedModel& model) const {
    const auto n = static_cast<long>(series_.size());
    SubjectRun run;
    run.results.resize(series_.size());
    run.failures.resize(series_.size());
    std::vector<std::exception_ptr> errors(series_.size());

    const int threads = resolve_threads(options_.num_threads);
    (void)threads;
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(threads)
#endif
    for (long i = 0; i < n; ++i) {
        try {
            run.results[i] = filter_.filter(model, series_[i]);
        } catch (const DegenerateLikelihood& e) {
            run.failures[i] = e.what();
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return run;
}

// An indefinite P0 or R can keep every innovation variance positive while the
// likelihood has no lower bound, so both must be valid covariances.
bool MultiSubjectObjective::feasible(const EvaluatedModel& model, std::string& reason) const {
    if (!positive_semidefinite(model.P0)) {
        reason = "initial state covariance is not positive semi-definite";
        return false;
    }
    if (!positive_semidefinite(model.R)) {
        reason = "measurement covariance is not positive semi-definite";
        return false;
    }
    return true;
}

double MultiSubjectObjective::penalize(const std::string& reason) const {
    ++degenerate_count_;
    if (options_.verbose) {
        std::cerr << "MultiSubjectObjective: degenerate trial point (" << reason << "), returning penalty "
                  << options_.degenerate_penalty << std::endl;
    }
    return options_.degenerate_penalty;
}

double MultiSubjectObjective::evaluate(const std::vector<double>& parameters, bool& penalized) const {
    penalized = true;
    const EvaluatedModel evaluated = model_.evaluate(parameters);
    std::string reason;
    if (!feasible(evaluated, reason)) {
        return penalize(reason);
    }

    const SubjectRun run = run_subjects(evaluated);
    double log_likelihood = 0.0;
    for (std::size_t i = 0; i < series_.size(); ++i) {
        if (!run.failures[i].empty()) {
            return penalize(run.failures[i]);
        }
        log_likelihood += run.results[i].log_likelihood;
    }
    if (!std::isfinite(log_likelihood)) {
        return penalize("non-finite log-likelihood");
    }
    penalized = false;
    return -log_likelihood;
}

double MultiSubjectObjective::value(const std::vector<double>& parameters) const {
    bool penalized = false;
    return evaluate(parameters, penalized);
}

std::vector<double> MultiSubjectObjective::gradient(const std::vector<double>& parameters) const {
    const std::vector<double> lower = model_.catalog().lower_bounds();
    const std::vector<double> upper = model_.catalog().upper_bounds();
    if (parameters.size() != lower.size()) {
        throw std::invalid_argument("parameter vector size does not match model");
    }

    std::vector<double> grad(parameters.size(), 0.0);
    std::vector<double> trial = parameters;
    bool have_center = false;
    bool center_penalized = false;
    double f_center = 0.0;
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        const double x = parameters[i];
        const double h = options_.finite_difference_step * std::max(1.0, std::abs(x));
        // Central difference in the interior, one-sided against a bound.
        const double up = std::min(x + h, upper[i]);
        const double down = std::max(x - h, lower[i]);
        if (!(up > down)) {
            continue;
        }
        bool up_penalized = false;
        bool down_penalized = false;
        trial[i] = up;
        const double f_up = evaluate(trial, up_penalized);
        trial[i] = down;
        const double f_down = evaluate(trial, down_penalized);
        trial[i] = x;
        if (up_penalized == down_penalized) {
            grad[i] = (f_up - f_down) / (up - down);
            continue;
        }

        // One trial point left the feasible region: difference against the center.
        if (!have_center) {
            f_center = evaluate(parameters, center_penalized);
            have_center = true;
        }
        if (center_penalized) {
            continue;
        }
        if (up_penalized && x > down) {
            grad[i] = (f_center - f_down) / (x - down);
        } else if (down_penalized && up > x) {
            grad[i] = (f_up - f_center) / (up - x);
        }
    }
    return grad;
}

double MultiSubjectObjective::value_and_gradient(const std::vector<double>& parameters,
                                                 std::vector<double>& gradient) const {
    gradient = this->gradient(parameters);
    return value(parameters);
}

SubjectEvaluation MultiSubjectObjective::evaluate_subjects(const std::vector<double>& parameters) const {
    const EvaluatedModel evaluated = model_.evaluate(parameters);
    const SubjectRun run = run_subjects(evaluated);

    SubjectEvaluation evaluation;
    evaluation.log_likelihoods.reserve(series_.size());
    evaluation.terminal_states.reserve(series_.size());
    for (std::size_t i = 0; i < series_.size(); ++i) {
        if (!run.failures[i].empty()) {
            throw DegenerateLikelihood(run.failures[i]);
        }
        evaluation.log_likelihoods.push_back(run.results[i].log_likelihood);
        evaluation.terminal_states.push_back(run.results[i].terminal_state);
        evaluation.total_log_likelihood += run.results[i].log_likelihood;
    }
    return evaluation;
}

}  // namespace libctsm
