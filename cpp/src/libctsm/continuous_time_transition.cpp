#include "libctsm/continuous_time_transition.hpp"

#include <unsupported/Eigen/MatrixFunctions>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace libctsm {

ContinuousTimeTransition::ContinuousTimeTransition(Eigen::MatrixXd drift, Eigen::MatrixXd diffusion)
    : drift_(std::move(drift)), diffusion_(std::move(diffusion)) {
    if (drift_.rows() != drift_.cols() || drift_.rows() == 0) {
        throw std::invalid_argument("drift matrix must be square and non-empty");
    }
    if (diffusion_.rows() != drift_.rows() || diffusion_.cols() != drift_.cols()) {
        throw std::invalid_argument("diffusion matrix must match drift dimensions");
    }
    if (!drift_.allFinite() || !diffusion_.allFinite()) {
        throw std::invalid_argument("drift and diffusion matrices must be finite");
    }
    forcing_ = Eigen::VectorXd::Zero(drift_.rows());
    has_noise_ = !diffusion_.isZero(0.0);
}

ContinuousTimeTransition::ContinuousTimeTransition(Eigen::MatrixXd drift,
                                                   Eigen::MatrixXd diffusion,
                                                   const Eigen::MatrixXd& input_matrix,
                                                   const Eigen::VectorXd& input)
    : ContinuousTimeTransition(std::move(drift), std::move(diffusion)) {
    if (input_matrix.rows() != drift_.rows() || input_matrix.cols() != input.size()) {
        throw std::invalid_argument("input matrix must be " + std::to_string(drift_.rows()) + " x " +
                                    std::to_string(input.size()));
    }
    forcing_ = input_matrix * input;
    if (!forcing_.allFinite()) {
        throw std::invalid_argument("input effects must be finite");
    }
    has_forcing_ = !forcing_.isZero(0.0);
}

Eigen::Index ContinuousTimeTransition::dimension() const noexcept {
    return drift_.rows();
}

void ContinuousTimeTransition::check_interval(double dt) const {
    if (!std::isfinite(dt) || dt < 0.0) {
        throw std::invalid_argument("elapsed interval must be finite and non-negative: " + std::to_string(dt));
    }
}

Eigen::MatrixXd ContinuousTimeTransition::transition(double dt) const {
    check_interval(dt);
    const Eigen::Index n = drift_.rows();
    if (dt == 0.0) {
        return Eigen::MatrixXd::Identity(n, n);
    }
    Eigen::MatrixXd scaled = drift_ * dt;
    return scaled.exp();
}

Eigen::MatrixXd ContinuousTimeTransition::process_noise(double dt) const {
    return discretize(dt).process_noise;
}

DiscreteTransition ContinuousTimeTransition::discretize(double dt) const {
    check_interval(dt);
    const Eigen::Index n = drift_.rows();

    DiscreteTransition result;
    result.process_noise = Eigen::MatrixXd::Zero(n, n);
    result.input_effect = Eigen::VectorXd::Zero(n);
    if (dt == 0.0) {
        result.transition = Eigen::MatrixXd::Identity(n, n);
        return result;
    }

    if (has_noise_) {
        // exp([[-A, Q], [0, A']] dt) = [[F11, F12], [0, F22]] with
        // F22 = exp(A dt)' and exp(A dt) * F12 = Qd.
        Eigen::MatrixXd van_loan = Eigen::MatrixXd::Zero(2 * n, 2 * n);
        van_loan.topLeftCorner(n, n) = -drift_ * dt;
        van_loan.topRightCorner(n, n) = diffusion_ * dt;
        van_loan.bottomRightCorner(n, n) = drift_.transpose() * dt;
        const Eigen::MatrixXd block_exp = van_loan.exp();

        result.transition = block_exp.bottomRightCorner(n, n).transpose();
        Eigen::MatrixXd qd = result.transition * block_exp.topRightCorner(n, n);
        result.process_noise = 0.5 * (qd + qd.transpose());
    } else {
        result.transition = transition(dt);
    }

    if (has_forcing_) {
        Eigen::MatrixXd augmented = Eigen::MatrixXd::Zero(n + 1, n + 1);
        augmented.topLeftCorner(n, n) = drift_ * dt;
        augmented.topRightCorner(n, 1) = forcing_ * dt;
        const Eigen::MatrixXd augmented_exp = augmented.exp();
        result.input_effect = augmented_exp.topRightCorner(n, 1);
    }

    return result;
}

}  // namespace libctsm
