#pragma once

#include "libctsm/kalman_filter.hpp"
#include "libctsm/model_spec.hpp"
#include "libctsm/model_types.hpp"
#include "libctsm/optimizer.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace libctsm {

struct ObjectiveOptions {
    int num_threads{0};                 // 0 = OpenMP runtime default
    double degenerate_penalty{1e10};    // value returned for infeasible trial points
    double finite_difference_step{1e-6};  // relative to max(1, |theta_i|)
    bool verbose{false};
};

struct SubjectEvaluation {
    std::vector<double> log_likelihoods;   // one per subject, input order
    std::vector<FilterState> terminal_states;
    double total_log_likelihood{0.0};
};

/**
 * Joint negative log-likelihood of a panel of independent subjects that
 * share one parameter vector.
 *
 * Subjects are filtered independently and their contributions summed in
 * input order, so the value does not depend on the thread count.
 */
class MultiSubjectObjective : public ObjectiveFunction {
public:
    MultiSubjectObjective(ModelSpec model,
                          std::vector<SubjectSeries> series,
                          ObjectiveOptions options = ObjectiveOptions());

    [[nodiscard]] double value(const std::vector<double>& parameters) const override;

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& parameters) const override;

    [[nodiscard]] double value_and_gradient(const std::vector<double>& parameters,
                                            std::vector<double>& gradient) const override;

    // Unpenalized evaluation for reporting.
    // @throws DegenerateLikelihood if any subject is degenerate.
    [[nodiscard]] SubjectEvaluation evaluate_subjects(const std::vector<double>& parameters) const;

    // Number of trial points that received the penalty so far.
    [[nodiscard]] std::size_t degenerate_evaluations() const noexcept;

    [[nodiscard]] const std::vector<std::string>& parameter_names() const noexcept;

    [[nodiscard]] std::vector<double> initial_parameters() const;

    [[nodiscard]] Bounds bounds() const;

    [[nodiscard]] const ModelSpec& model() const noexcept;

    [[nodiscard]] const std::vector<SubjectSeries>& series() const noexcept;

    [[nodiscard]] std::size_t observation_count() const noexcept;

    [[nodiscard]] const ObjectiveOptions& options() const noexcept;

private:
    struct SubjectRun {
        std::vector<FilterResult> results;
        std::vector<std::string> failures;  // non-empty message marks a degenerate subject
    };

    [[nodiscard]] SubjectRun run_subjects(const EvaluatedModel& model) const;

    [[nodiscard]] bool feasible(const EvaluatedModel& model, std::string& reason) const;

    // Objective value; `penalized` reports whether the penalty was returned.
    [[nodiscard]] double evaluate(const std::vector<double>& parameters, bool& penalized) const;

    double penalize(const std::string& reason) const;

    ModelSpec model_;
    std::vector<SubjectSeries> series_;
    ObjectiveOptions options_;
    KalmanFilter filter_;
    std::size_t observation_count_{0};
    mutable std::atomic<std::size_t> degenerate_count_{0};
};

}  // namespace libctsm
