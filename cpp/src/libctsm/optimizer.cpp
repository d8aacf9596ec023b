#include "libctsm/optimizer.hpp"

#include <Eigen/Core>
#include <LBFGSB.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace libctsm {

namespace {
using Clock = std::chrono::steady_clock;

class TimeBudgetExceeded : public std::runtime_error {
public:
    TimeBudgetExceeded() : std::runtime_error("wall-clock budget exhausted") {}
};

[[nodiscard]] bool valid_options(const OptimizationOptions& options) {
    return options.max_iterations > 0 && options.tolerance > 0.0 && options.learning_rate > 0.0 &&
           options.m > 0 && options.past >= 0 && options.delta >= 0.0 && options.max_linesearch > 0 &&
           options.max_seconds >= 0.0;
}

void validate_bounds(const Bounds& bounds, std::size_t size) {
    if (bounds.lower.size() != size || bounds.upper.size() != size) {
        throw std::invalid_argument("bounds size does not match parameter count");
    }
    for (std::size_t i = 0; i < size; ++i) {
        if (std::isnan(bounds.lower[i]) || std::isnan(bounds.upper[i]) || bounds.lower[i] > bounds.upper[i]) {
            throw std::invalid_argument("invalid bounds for parameter " + std::to_string(i));
        }
    }
}

void project(std::vector<double>& parameters, const Bounds& bounds) {
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        parameters[i] = std::clamp(parameters[i], bounds.lower[i], bounds.upper[i]);
    }
}

[[nodiscard]] double elapsed_seconds(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

[[nodiscard]] bool out_of_time(const OptimizationOptions& options, Clock::time_point start) {
    return options.max_seconds > 0.0 && elapsed_seconds(start) > options.max_seconds;
}

[[nodiscard]] bool relative_change_small(double previous, double current, double delta) {
    const double scale = std::max({std::abs(previous), std::abs(current), 1.0});
    return std::abs(previous - current) <= delta * scale;
}
}  // namespace

Bounds Bounds::unbounded(std::size_t size) {
    constexpr double kInf = std::numeric_limits<double>::infinity();
    return Bounds{std::vector<double>(size, -kInf), std::vector<double>(size, kInf)};
}

double projected_gradient_norm(const std::vector<double>& parameters,
                               const std::vector<double>& gradient,
                               const Bounds& bounds) {
    if (gradient.size() != parameters.size()) {
        throw std::invalid_argument("gradient dimension mismatch");
    }
    validate_bounds(bounds, parameters.size());
    double norm = 0.0;
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        const double moved = std::clamp(parameters[i] - gradient[i], bounds.lower[i], bounds.upper[i]);
        norm = std::max(norm, std::abs(moved - parameters[i]));
    }
    return norm;
}

std::string to_string(OptimizationStatus status) {
    switch (status) {
        case OptimizationStatus::Converged: return "converged";
        case OptimizationStatus::IterationLimit: return "iteration limit reached";
        case OptimizationStatus::TimeLimit: return "time limit reached";
    }
    return "unknown";
}

std::string ProjectedGradientOptimizer::name() const {
    return "projected_gradient";
}

OptimizationResult ProjectedGradientOptimizer::optimize(const ObjectiveFunction& function,
                                                        std::vector<double> parameters,
                                                        const Bounds& bounds,
                                                        const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }
    validate_bounds(bounds, parameters.size());
    const auto start = Clock::now();

    OptimizationResult result;
    result.parameters = std::move(parameters);
    project(result.parameters, bounds);

    const double decrease_factor = 0.5;
    const double increase_factor = 1.05;
    const double sufficient_decrease = 1e-4;
    const double min_step = 1e-12;
    double step_size = options.learning_rate;
    std::vector<double> gradient(result.parameters.size());
    std::vector<double> candidate(result.parameters.size());

    double objective = function.value_and_gradient(result.parameters, gradient);
    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        result.iterations = iter + 1;
        result.objective_value = objective;
        result.gradient_norm = projected_gradient_norm(result.parameters, gradient, bounds);

        if (result.gradient_norm <= options.tolerance) {
            result.converged = true;
            result.message = "projected gradient below tolerance";
            break;
        }
        if (out_of_time(options, start)) {
            result.status = OptimizationStatus::TimeLimit;
            result.message = "wall-clock budget exhausted";
            return result;
        }

        bool accepted = false;
        double step = step_size;
        double candidate_objective = objective;
        while (step >= min_step) {
            double directional = 0.0;
            for (std::size_t i = 0; i < result.parameters.size(); ++i) {
                candidate[i] = std::clamp(result.parameters[i] - step * gradient[i], bounds.lower[i], bounds.upper[i]);
                directional += gradient[i] * (result.parameters[i] - candidate[i]);
            }
            candidate_objective = function.value(candidate);
            if (std::isfinite(candidate_objective) &&
                candidate_objective <= objective - sufficient_decrease * directional) {
                accepted = true;
                break;
            }
            step *= decrease_factor;
        }

        if (!accepted) {
            // No descent left along the projected path.
            result.converged = true;
            result.message = "step below minimum without descent";
            break;
        }

        const double previous = objective;
        result.parameters = candidate;
        objective = function.value_and_gradient(result.parameters, gradient);
        step_size = std::min(step * increase_factor, options.learning_rate * 4.0);

        if (options.past > 0 && relative_change_small(previous, objective, options.delta)) {
            result.iterations = iter + 1;
            result.objective_value = objective;
            result.gradient_norm = projected_gradient_norm(result.parameters, gradient, bounds);
            result.converged = true;
            result.message = "relative objective change below delta";
            break;
        }
    }

    if (result.converged) {
        result.status = OptimizationStatus::Converged;
    } else {
        result.objective_value = objective;
        result.gradient_norm = projected_gradient_norm(result.parameters, gradient, bounds);
        result.status = OptimizationStatus::IterationLimit;
        result.message = "iteration budget exhausted";
    }
    return result;
}

std::unique_ptr<Optimizer> make_projected_gradient_optimizer() {
    return std::make_unique<ProjectedGradientOptimizer>();
}

namespace {
class LBFGSBFunctor {
public:
    LBFGSBFunctor(const ObjectiveFunction& function, const OptimizationOptions& options, Clock::time_point start)
        : function_(function), options_(options), start_(start) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        if (out_of_time(options_, start_)) {
            throw TimeBudgetExceeded();
        }
        std::vector<double> params(x.data(), x.data() + x.size());
        std::vector<double> g(grad.size());
        double value = function_.value_and_gradient(params, g);

        if (g.size() != static_cast<std::size_t>(grad.size())) {
            throw std::runtime_error("Gradient dimension mismatch");
        }
        for (std::size_t i = 0; i < g.size(); ++i) grad[i] = g[i];

        if (std::isfinite(value) && (best_parameters_.empty() || value < best_value_)) {
            best_value_ = value;
            best_parameters_ = std::move(params);
            ++improvements_;
        }
        return value;
    }

    [[nodiscard]] bool has_best() const noexcept { return !best_parameters_.empty(); }
    [[nodiscard]] const std::vector<double>& best_parameters() const noexcept { return best_parameters_; }

    // Every completed iteration lowers the objective, so the improvements after
    // the starting point bound the iterations spent.
    [[nodiscard]] std::size_t iterations_used() const noexcept {
        return improvements_ > 0 ? improvements_ - 1 : 0;
    }

private:
    const ObjectiveFunction& function_;
    const OptimizationOptions& options_;
    Clock::time_point start_;
    std::vector<double> best_parameters_;
    double best_value_{std::numeric_limits<double>::infinity()};
    std::size_t improvements_{0};
};
}  // namespace

std::string LBFGSBOptimizer::name() const {
    return "lbfgsb";
}

OptimizationResult LBFGSBOptimizer::optimize(const ObjectiveFunction& function,
                                             std::vector<double> initial_parameters,
                                             const Bounds& bounds,
                                             const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }
    validate_bounds(bounds, initial_parameters.size());
    project(initial_parameters, bounds);
    const auto start = Clock::now();
    const auto n = static_cast<Eigen::Index>(initial_parameters.size());

    LBFGSpp::LBFGSBParam<double> param;
    param.epsilon = options.tolerance;
    param.epsilon_rel = 0.0;
    param.max_iterations = static_cast<int>(options.max_iterations);
    param.m = options.m;
    param.past = options.past;
    param.delta = options.delta;
    param.max_linesearch = options.max_linesearch;

    LBFGSpp::LBFGSBSolver<double> solver(param);
    LBFGSBFunctor functor(function, options, start);

    Eigen::VectorXd x = Eigen::Map<Eigen::VectorXd>(initial_parameters.data(), n);
    const Eigen::VectorXd lb = Eigen::Map<const Eigen::VectorXd>(bounds.lower.data(), n);
    const Eigen::VectorXd ub = Eigen::Map<const Eigen::VectorXd>(bounds.upper.data(), n);
    double fx = 0.0;

    OptimizationResult result;
    int niter = 0;
    try {
        niter = solver.minimize(functor, x, fx, lb, ub);
    } catch (const TimeBudgetExceeded&) {
        result.parameters = functor.has_best() ? functor.best_parameters() : initial_parameters;
        std::vector<double> grad;
        result.objective_value = function.value_and_gradient(result.parameters, grad);
        result.gradient_norm = projected_gradient_norm(result.parameters, grad, bounds);
        result.iterations = std::min(functor.iterations_used(), options.max_iterations);
        result.status = OptimizationStatus::TimeLimit;
        result.message = "wall-clock budget exhausted";
        if (options.verbose) {
            std::cerr << "L-BFGS-B: wall-clock budget of " << options.max_seconds << "s exhausted" << std::endl;
        }
        return result;
    } catch (const std::exception& e) {
        // Line search failures: continue from the best point seen so far.
        if (options.verbose) {
            std::cerr << "L-BFGS-B failed (" << e.what() << "), falling back to projected gradient" << std::endl;
        }
        std::vector<double> current = functor.has_best() ? functor.best_parameters() : initial_parameters;
        const std::size_t used = std::min(functor.iterations_used(), options.max_iterations);
        if (used >= options.max_iterations) {
            result.parameters = std::move(current);
            std::vector<double> grad;
            result.objective_value = function.value_and_gradient(result.parameters, grad);
            result.gradient_norm = projected_gradient_norm(result.parameters, grad, bounds);
            result.iterations = used;
            result.status = OptimizationStatus::IterationLimit;
            result.message = "iteration budget exhausted";
            return result;
        }

        OptimizationOptions fallback_options = options;
        fallback_options.max_iterations = options.max_iterations - used;
        if (options.max_seconds > 0.0) {
            fallback_options.max_seconds = std::max(options.max_seconds - elapsed_seconds(start),
                                                    std::numeric_limits<double>::min());
        }
        ProjectedGradientOptimizer fallback;
        result = fallback.optimize(function, std::move(current), bounds, fallback_options);
        result.iterations += used;
        return result;
    }

    result.parameters.assign(x.data(), x.data() + x.size());
    result.objective_value = fx;
    result.iterations = static_cast<std::size_t>(niter);

    std::vector<double> final_grad = function.gradient(result.parameters);
    result.gradient_norm = projected_gradient_norm(result.parameters, final_grad, bounds);
    result.converged = result.iterations < options.max_iterations || result.gradient_norm <= options.tolerance;
    if (result.converged) {
        result.status = OptimizationStatus::Converged;
        result.message = result.gradient_norm <= options.tolerance ? "projected gradient below tolerance"
                                                                    : "relative objective change below delta";
    } else {
        result.status = OptimizationStatus::IterationLimit;
        result.message = "iteration budget exhausted";
        if (options.verbose) {
            std::cerr << "L-BFGS-B: no convergence after " << result.iterations
                      << " iterations, projected gradient " << result.gradient_norm << std::endl;
        }
    }
    return result;
}

std::unique_ptr<Optimizer> make_lbfgsb_optimizer() {
    return std::make_unique<LBFGSBOptimizer>();
}

std::unique_ptr<Optimizer> make_optimizer(const std::string& name) {
    if (name == "lbfgsb") {
        return make_lbfgsb_optimizer();
    }
    if (name == "projected_gradient") {
        return make_projected_gradient_optimizer();
    }
    throw std::invalid_argument("Unknown optimizer: " + name);
}

}  // namespace libctsm
