#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace libctsm {

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

enum class MatrixId {
    A,   // drift
    B,   // input effects on the latent state
    C,   // loadings
    D,   // input effects on the observations
    Q,   // process noise intensity
    R,   // measurement noise
    X0,  // initial state mean
    P0,  // initial state covariance
    U    // inputs
};

struct Observation {
    double time{0.0};
    double value{0.0};
    std::size_t occasion{0};  // column in the wide-format source
};

struct SubjectSeries {
    std::string id;
    std::vector<Observation> observations;

    [[nodiscard]] bool empty() const noexcept { return observations.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return observations.size(); }
};

struct FilterState {
    Eigen::VectorXd mean;
    Eigen::MatrixXd covariance;
    double time{0.0};
};

struct MatrixEntrySpec {
    MatrixId matrix;
    std::size_t row;
    std::size_t col;
    std::string parameter_id;  // empty when fixed
    double fixed_value{0.0};
};

struct ParameterSpec {
    std::string id;
    double initial_value{0.0};
    double lower_bound{-std::numeric_limits<double>::infinity()};
    double upper_bound{std::numeric_limits<double>::infinity()};
};

[[nodiscard]] std::string to_string(MatrixId id);

}  // namespace libctsm
