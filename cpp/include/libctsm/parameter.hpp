#pragma once

#include <limits>
#include <string>

namespace libctsm {

class Parameter {
public:
    Parameter(std::string name, double value);

    Parameter(std::string name, double value, double lower_bound, double upper_bound);

    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] double value() const noexcept;

    void set_value(double value);

    [[nodiscard]] double lower_bound() const noexcept;

    [[nodiscard]] double upper_bound() const noexcept;

    [[nodiscard]] bool is_bounded() const noexcept;

    [[nodiscard]] bool within_bounds(double value) const noexcept;

    [[nodiscard]] double project(double value) const noexcept;

    // True when value lies within tolerance of a finite bound.
    [[nodiscard]] bool at_bound(double value, double tolerance) const noexcept;

private:
    std::string name_;
    double value_;
    double lower_bound_{-std::numeric_limits<double>::infinity()};
    double upper_bound_{std::numeric_limits<double>::infinity()};
};

}  // namespace libctsm
