#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "libctsm/optimizer.hpp"

namespace {
class QuadraticObjective final : public libctsm::ObjectiveFunction {
public:
    QuadraticObjective(std::vector<double> center, double scale)
        : center_(std::move(center)), scale_(scale) {}

    [[nodiscard]] double value(const std::vector<double>& parameters) const override {
        double accum = 0.0;
        for (std::size_t i = 0; i < parameters.size(); ++i) {
            const double diff = parameters[i] - center_[i];
            accum += diff * diff;
        }
        return 0.5 * scale_ * accum;
    }

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& parameters) const override {
        std::vector<double> grad(parameters.size(), 0.0);
        for (std::size_t i = 0; i < parameters.size(); ++i) {
            grad[i] = scale_ * (parameters[i] - center_[i]);
        }
        return grad;
    }

private:
    std::vector<double> center_;
    double scale_;
};

class RosenbrockObjective final : public libctsm::ObjectiveFunction {
public:
    explicit RosenbrockObjective(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : delay_(delay) {}

    [[nodiscard]] double value(const std::vector<double>& x) const override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        const double a = 1.0 - x[0];
        const double b = x[1] - x[0] * x[0];
        return a * a + 100.0 * b * b;
    }

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& x) const override {
        const double b = x[1] - x[0] * x[0];
        return {-2.0 * (1.0 - x[0]) - 400.0 * x[0] * b, 200.0 * b};
    }

private:
    std::chrono::milliseconds delay_;
};

// Rosenbrock whose gradient turns uphill after a number of evaluations, which
// leaves the quasi-Newton line search without an acceptable step.
class MisleadingGradientObjective final : public libctsm::ObjectiveFunction {
public:
    explicit MisleadingGradientObjective(std::size_t honest_calls) : honest_calls_(honest_calls) {}

    [[nodiscard]] double value(const std::vector<double>& x) const override {
        return rosenbrock_.value(x);
    }

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& x) const override {
        auto grad = rosenbrock_.gradient(x);
        if (calls_++ >= honest_calls_) {
            for (auto& g : grad) {
                g = -g;
            }
        }
        return grad;
    }

private:
    RosenbrockObjective rosenbrock_;
    std::size_t honest_calls_;
    mutable std::size_t calls_{0};
};

libctsm::OptimizationOptions tight_options() {
    libctsm::OptimizationOptions options;
    options.max_iterations = 500;
    options.tolerance = 1e-8;
    options.past = 0;
    return options;
}
}  // namespace

TEST_CASE("ProjectedGradientOptimizer converges on quadratic", "[optimizer]") {
    auto optimizer = libctsm::make_projected_gradient_optimizer();
    QuadraticObjective objective({1.0, -2.0}, 2.0);

    const auto options = tight_options();
    const auto result = optimizer->optimize(objective, {5.0, 5.0}, libctsm::Bounds::unbounded(2), options);
    REQUIRE(result.converged);
    REQUIRE(result.status == libctsm::OptimizationStatus::Converged);
    REQUIRE(result.iterations > 0);
    REQUIRE(result.gradient_norm <= options.tolerance * 10.0);
    REQUIRE(result.parameters[0] == Catch::Approx(1.0).margin(1e-4));
    REQUIRE(result.parameters[1] == Catch::Approx(-2.0).margin(1e-4));
}

TEST_CASE("LBFGSBOptimizer converges on quadratic", "[optimizer]") {
    auto optimizer = libctsm::make_lbfgsb_optimizer();
    QuadraticObjective objective({1.0, -2.0}, 2.0);

    const auto options = tight_options();
    const auto result = optimizer->optimize(objective, {5.0, 5.0}, libctsm::Bounds::unbounded(2), options);
    REQUIRE(result.converged);
    REQUIRE(result.iterations < options.max_iterations);
    REQUIRE(result.parameters[0] == Catch::Approx(1.0).margin(1e-6));
    REQUIRE(result.parameters[1] == Catch::Approx(-2.0).margin(1e-6));
    REQUIRE(result.objective_value == Catch::Approx(0.0).margin(1e-10));
}

TEST_CASE("Optimizers stop at an active bound", "[optimizer]") {
    QuadraticObjective objective({1.0, -2.0}, 2.0);
    const libctsm::Bounds bounds{{-1.0, 0.0}, {0.5, 3.0}};
    const auto options = tight_options();

    for (const auto* name : {"lbfgsb", "projected_gradient"}) {
        auto optimizer = libctsm::make_optimizer(name);
        REQUIRE(optimizer->name() == name);
        const auto result = optimizer->optimize(objective, {0.0, 2.0}, bounds, options);
        REQUIRE(result.converged);
        REQUIRE(result.parameters[0] == Catch::Approx(0.5).margin(1e-6));
        REQUIRE(result.parameters[1] == Catch::Approx(0.0).margin(1e-6));
        REQUIRE(result.gradient_norm <= options.tolerance * 10.0);
    }
}

TEST_CASE("Initial values are projected into the box", "[optimizer]") {
    QuadraticObjective objective({0.2, 0.2}, 1.0);
    const libctsm::Bounds bounds{{0.0, 0.0}, {1.0, 1.0}};
    auto optimizer = libctsm::make_lbfgsb_optimizer();
    const auto result = optimizer->optimize(objective, {-4.0, 9.0}, bounds, tight_options());
    REQUIRE(result.converged);
    REQUIRE(result.parameters[0] == Catch::Approx(0.2).margin(1e-6));
    REQUIRE(result.parameters[1] == Catch::Approx(0.2).margin(1e-6));
}

TEST_CASE("LBFGSBOptimizer handles Rosenbrock", "[optimizer]") {
    RosenbrockObjective objective;
    auto optimizer = libctsm::make_lbfgsb_optimizer();
    auto options = tight_options();
    options.tolerance = 1e-6;
    const auto result = optimizer->optimize(objective, {-1.2, 1.0}, libctsm::Bounds::unbounded(2), options);
    REQUIRE(result.converged);
    REQUIRE(result.parameters[0] == Catch::Approx(1.0).margin(1e-3));
    REQUIRE(result.parameters[1] == Catch::Approx(1.0).margin(1e-3));
}

TEST_CASE("Exhausted iteration budget is reported", "[optimizer]") {
    RosenbrockObjective objective;
    libctsm::OptimizationOptions options;
    options.max_iterations = 2;
    options.past = 0;

    for (const auto* name : {"lbfgsb", "projected_gradient"}) {
        auto optimizer = libctsm::make_optimizer(name);
        const auto result = optimizer->optimize(objective, {-1.2, 1.0}, libctsm::Bounds::unbounded(2), options);
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.status == libctsm::OptimizationStatus::IterationLimit);
        REQUIRE(result.parameters.size() == 2);
        // Best point so far is no worse than the start.
        REQUIRE(result.objective_value <= objective.value({-1.2, 1.0}));
    }
}

TEST_CASE("Fallback after a failed line search shares the iteration budget", "[optimizer]") {
    const std::vector<double> start{-1.2, 1.0};
    for (std::size_t max_iterations : {3u, 10u, 50u}) {
        MisleadingGradientObjective objective(12);
        libctsm::OptimizationOptions options;
        options.max_iterations = max_iterations;
        options.past = 0;

        const auto result = libctsm::make_lbfgsb_optimizer()->optimize(objective, start,
                                                                       libctsm::Bounds::unbounded(2), options);
        REQUIRE(result.iterations >= 1);
        REQUIRE(result.iterations <= max_iterations);
        REQUIRE(result.parameters.size() == 2);
        REQUIRE(result.objective_value <= objective.value(start));
    }

    // Iterations spent before the failure are part of the reported count.
    MisleadingGradientObjective objective(12);
    libctsm::OptimizationOptions options;
    options.max_iterations = 50;
    options.past = 0;
    const auto result =
        libctsm::make_lbfgsb_optimizer()->optimize(objective, start, libctsm::Bounds::unbounded(2), options);
    REQUIRE(result.iterations > 1);
    REQUIRE(result.objective_value < objective.value(start));
}

TEST_CASE("Wall-clock budget is reported", "[optimizer]") {
    RosenbrockObjective objective(std::chrono::milliseconds(5));
    libctsm::OptimizationOptions options;
    options.max_seconds = 0.001;

    for (const auto* name : {"lbfgsb", "projected_gradient"}) {
        auto optimizer = libctsm::make_optimizer(name);
        const auto result = optimizer->optimize(objective, {-1.2, 1.0}, libctsm::Bounds::unbounded(2), options);
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.status == libctsm::OptimizationStatus::TimeLimit);
        REQUIRE(result.parameters.size() == 2);
    }
}

TEST_CASE("Invalid optimizer input is rejected", "[optimizer]") {
    QuadraticObjective objective({0.0}, 1.0);
    auto optimizer = libctsm::make_lbfgsb_optimizer();
    libctsm::OptimizationOptions options;

    REQUIRE_THROWS_AS(optimizer->optimize(objective, {0.0}, libctsm::Bounds{{1.0}, {0.0}}, options),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(optimizer->optimize(objective, {0.0}, libctsm::Bounds::unbounded(2), options),
                      std::invalid_argument);

    options.tolerance = 0.0;
    REQUIRE_THROWS_AS(optimizer->optimize(objective, {0.0}, libctsm::Bounds::unbounded(1), options),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(libctsm::make_optimizer("nelder_mead"), std::invalid_argument);
}

TEST_CASE("Projected gradient norm ignores blocked directions", "[optimizer]") {
    const libctsm::Bounds bounds{{0.0, 0.0}, {1.0, 1.0}};
    // Gradient pushes the first coordinate below its lower bound.
    REQUIRE(libctsm::projected_gradient_norm({0.0, 0.5}, {3.0, 0.0}, bounds) == 0.0);
    REQUIRE(libctsm::projected_gradient_norm({0.0, 0.5}, {-3.0, 0.0}, bounds) == Catch::Approx(1.0));
    REQUIRE(libctsm::projected_gradient_norm({0.5, 0.5}, {0.1, -0.2}, bounds) == Catch::Approx(0.2));
    REQUIRE(libctsm::to_string(libctsm::OptimizationStatus::TimeLimit) == "time limit reached");
}
