#pragma once

#include <Eigen/Dense>

namespace libctsm {

struct DiscreteTransition {
    Eigen::MatrixXd transition;     // exp(A dt)
    Eigen::MatrixXd process_noise;  // integral of exp(A s) Q exp(A' s) over [0, dt]
    Eigen::VectorXd input_effect;   // integral of exp(A s) ds, times B u
};

/**
 * Discretizes linear time-invariant dynamics dx = (A x + B u) dt + dW,
 * Cov(dW) = Q dt, over an arbitrary elapsed interval.
 *
 * The process noise and input integrals are taken from block matrix
 * exponentials (Van Loan, 1978), so singular drift matrices are handled
 * without inverting A.
 */
class ContinuousTimeTransition {
public:
    ContinuousTimeTransition(Eigen::MatrixXd drift, Eigen::MatrixXd diffusion);

    ContinuousTimeTransition(Eigen::MatrixXd drift,
                             Eigen::MatrixXd diffusion,
                             const Eigen::MatrixXd& input_matrix,
                             const Eigen::VectorXd& input);

    [[nodiscard]] Eigen::Index dimension() const noexcept;

    // dt == 0 gives the identity transition with zero noise and input.
    [[nodiscard]] DiscreteTransition discretize(double dt) const;

    [[nodiscard]] Eigen::MatrixXd transition(double dt) const;

    [[nodiscard]] Eigen::MatrixXd process_noise(double dt) const;

private:
    void check_interval(double dt) const;

    Eigen::MatrixXd drift_;
    Eigen::MatrixXd diffusion_;
    Eigen::VectorXd forcing_;  // B u
    bool has_noise_{false};
    bool has_forcing_{false};
};

}  // namespace libctsm
