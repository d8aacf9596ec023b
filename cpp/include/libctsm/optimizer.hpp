#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace libctsm {

struct OptimizationOptions {
    std::size_t max_iterations{200};
    double tolerance{1e-5};        // projected gradient (infinity norm)
    double learning_rate{0.1};     // initial step of the projected gradient search
    double max_seconds{0.0};       // wall-clock budget, 0 = unlimited

    // L-BFGS-B specific options
    int m{6};                      // History size
    int past{1};                   // Distance for delta-based convergence
    double delta{1e-9};            // Relative objective decrease for convergence
    int max_linesearch{20};        // Max line search trials

    bool verbose{false};
};

enum class OptimizationStatus {
    Converged,
    IterationLimit,
    TimeLimit
};

struct OptimizationResult {
    std::vector<double> parameters;
    double objective_value{0.0};
    double gradient_norm{0.0};     // projected gradient at the returned point
    std::size_t iterations{0};
    bool converged{false};
    OptimizationStatus status{OptimizationStatus::IterationLimit};
    std::string message;
};

// Box constraints; infinite entries leave a side unbounded.
struct Bounds {
    std::vector<double> lower;
    std::vector<double> upper;

    [[nodiscard]] static Bounds unbounded(std::size_t size);
};

class ObjectiveFunction {
public:
    virtual ~ObjectiveFunction() = default;

    [[nodiscard]] virtual double value(const std::vector<double>& parameters) const = 0;

    [[nodiscard]] virtual std::vector<double> gradient(const std::vector<double>& parameters) const = 0;

    // Optional fused evaluation to avoid computing value and gradient separately.
    [[nodiscard]] virtual double value_and_gradient(const std::vector<double>& parameters,
                                                    std::vector<double>& gradient) const {
        gradient = this->gradient(parameters);
        return this->value(parameters);
    }
};

class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual OptimizationResult optimize(const ObjectiveFunction& function,
                                                       std::vector<double> initial_parameters,
                                                       const Bounds& bounds,
                                                       const OptimizationOptions& options) const = 0;
};

class ProjectedGradientOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const Bounds& bounds,
                                               const OptimizationOptions& options) const override;
};

class LBFGSBOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const Bounds& bounds,
                                               const OptimizationOptions& options) const override;
};

[[nodiscard]] std::unique_ptr<Optimizer> make_projected_gradient_optimizer();

[[nodiscard]] std::unique_ptr<Optimizer> make_lbfgsb_optimizer();

// "lbfgsb" or "projected_gradient"
[[nodiscard]] std::unique_ptr<Optimizer> make_optimizer(const std::string& name);

// Infinity norm of P(x - g) - x, where P projects onto the box.
[[nodiscard]] double projected_gradient_norm(const std::vector<double>& parameters,
                                             const std::vector<double>& gradient,
                                             const Bounds& bounds);

[[nodiscard]] std::string to_string(OptimizationStatus status);

}  // namespace libctsm
