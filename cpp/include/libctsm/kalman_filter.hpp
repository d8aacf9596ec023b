#pragma once

#include "libctsm/model_spec.hpp"
#include "libctsm/model_types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace libctsm {

struct FilterOptions {
    bool keep_trace{false};  // record every predict/update step
};

struct FilterStep {
    double time{0.0};
    double elapsed{0.0};
    Eigen::VectorXd predicted_mean;
    Eigen::MatrixXd predicted_covariance;
    Eigen::VectorXd innovation;
    Eigen::MatrixXd innovation_covariance;
    Eigen::VectorXd filtered_mean;
    Eigen::MatrixXd filtered_covariance;
    double log_likelihood{0.0};
};

struct FilterResult {
    double log_likelihood{0.0};
    FilterState terminal_state;
    std::size_t n_observations{0};
    std::vector<FilterStep> steps;  // empty unless FilterOptions::keep_trace
};

/**
 * Kalman filter for continuous-time linear Gaussian state-space models
 * observed at irregular times.
 *
 * The state starts at (x0, P0) at the model's initial time. Each observation
 * is preceded by a prediction over the elapsed interval using the exact
 * discretization of the drift, and followed by the measurement update whose
 * innovation density gives the log-likelihood increment.
 */
class KalmanFilter {
public:
    explicit KalmanFilter(FilterOptions options = FilterOptions());

    /**
     * Runs the recursion over one subject's series.
     *
     * An empty series contributes zero log-likelihood and returns the
     * initial state.
     *
     * @throws DegenerateLikelihood if an innovation covariance is not
     *         positive definite.
     * @throws std::invalid_argument if the model is not univariate in its
     *         observations or an observation precedes the initial time.
     */
    [[nodiscard]] FilterResult filter(const EvaluatedModel& model, const SubjectSeries& series) const;

    [[nodiscard]] const FilterOptions& options() const noexcept;

private:
    FilterOptions options_;
};

}  // namespace libctsm
