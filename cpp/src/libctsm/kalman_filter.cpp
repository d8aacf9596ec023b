#include "libctsm/kalman_filter.hpp"

#include "libctsm/continuous_time_transition.hpp"
#include "libctsm/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace libctsm {

namespace {
constexpr double kLogTwoPi = 1.83787706640934548356;

void symmetrize(Eigen::MatrixXd& matrix) {
    matrix = 0.5 * (matrix + matrix.transpose()).eval();
}
}  // namespace

KalmanFilter::KalmanFilter(FilterOptions options) : options_(options) {}

const FilterOptions& KalmanFilter::options() const noexcept {
    return options_;
}

FilterResult KalmanFilter::filter(const EvaluatedModel& model, const SubjectSeries& series) const {
    const Eigen::Index n = model.latent_dimension();
    const Eigen::Index m = model.observed_dimension();
    if (m != 1) {
        throw std::invalid_argument("kalman filter expects one observed variable, model has " + std::to_string(m));
    }
    if (model.x0.size() != n || model.P0.rows() != n || model.P0.cols() != n) {
        throw std::invalid_argument("initial state does not match latent dimension");
    }

    FilterResult result;
    result.terminal_state.mean = model.x0;
    result.terminal_state.covariance = model.P0;
    result.terminal_state.time = model.initial_time;
    if (series.empty()) {
        return result;
    }

    const ContinuousTimeTransition dynamics(model.A, model.Q, model.B, model.u);
    const Eigen::VectorXd observation_input = model.D * model.u;
    const Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(n, n);

    Eigen::VectorXd mean = model.x0;
    Eigen::MatrixXd covariance = model.P0;
    double previous_time = model.initial_time;
    if (options_.keep_trace) {
        result.steps.reserve(series.size());
    }

    for (const auto& observation : series.observations) {
        const double elapsed = observation.time - previous_time;
        if (elapsed < 0.0) {
            throw std::invalid_argument("subject " + series.id + ": observation at time " +
                                        std::to_string(observation.time) + " precedes time " +
                                        std::to_string(previous_time));
        }

        // Predict
        const DiscreteTransition step = dynamics.discretize(elapsed);
        mean = step.transition * mean + step.input_effect;
        covariance = step.transition * covariance * step.transition.transpose() + step.process_noise;
        symmetrize(covariance);

        FilterStep trace;
        if (options_.keep_trace) {
            trace.time = observation.time;
            trace.elapsed = elapsed;
            trace.predicted_mean = mean;
            trace.predicted_covariance = covariance;
        }

        // Update
        const Eigen::VectorXd innovation =
            Eigen::VectorXd::Constant(1, observation.value) - model.C * mean - observation_input;
        Eigen::MatrixXd innovation_cov = model.C * covariance * model.C.transpose() + model.R;
        symmetrize(innovation_cov);

        Eigen::LLT<Eigen::MatrixXd> llt(innovation_cov);
        if (!innovation_cov.allFinite() || llt.info() != Eigen::Success) {
            throw DegenerateLikelihood("subject " + series.id + ": innovation covariance not positive definite at time " +
                                       std::to_string(observation.time));
        }
        const Eigen::MatrixXd chol = llt.matrixL();
        double log_det = 0.0;
        for (Eigen::Index i = 0; i < m; ++i) {
            log_det += 2.0 * std::log(chol(i, i));
        }
        const double quadratic = innovation.dot(llt.solve(innovation));
        const double increment = -0.5 * (static_cast<double>(m) * kLogTwoPi + log_det + quadratic);
        if (!std::isfinite(increment)) {
            throw DegenerateLikelihood("subject " + series.id + ": non-finite likelihood at time " +
                                       std::to_string(observation.time));
        }

        const Eigen::MatrixXd gain = llt.solve(model.C * covariance).transpose();
        mean += gain * innovation;
        covariance = (identity - gain * model.C) * covariance;
        symmetrize(covariance);

        result.log_likelihood += increment;
        ++result.n_observations;
        previous_time = observation.time;

        if (options_.keep_trace) {
            trace.innovation = innovation;
            trace.innovation_covariance = innovation_cov;
            trace.filtered_mean = mean;
            trace.filtered_covariance = covariance;
            trace.log_likelihood = increment;
            result.steps.push_back(std::move(trace));
        }
    }

    result.terminal_state.mean = std::move(mean);
    result.terminal_state.covariance = std::move(covariance);
    result.terminal_state.time = previous_time;
    return result;
}

}  // namespace libctsm
