#include "libctsm/parameter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace libctsm {

Parameter::Parameter(std::string name, double value)
    : Parameter(std::move(name), value,
                -std::numeric_limits<double>::infinity(),
                std::numeric_limits<double>::infinity()) {}

Parameter::Parameter(std::string name, double value, double lower_bound, double upper_bound)
    : name_(std::move(name)), value_(value), lower_bound_(lower_bound), upper_bound_(upper_bound) {
    if (name_.empty()) {
        throw std::invalid_argument("parameter name must be non-empty");
    }
    if (std::isnan(lower_bound_) || std::isnan(upper_bound_)) {
        throw std::invalid_argument("parameter bounds must not be NaN: " + name_);
    }
    if (!(lower_bound_ <= upper_bound_)) {
        throw std::invalid_argument("parameter lower bound exceeds upper bound: " + name_);
    }
    if (!std::isfinite(value_)) {
        throw std::invalid_argument("initial value must be finite: " + name_);
    }
    if (!within_bounds(value_)) {
        throw std::out_of_range("initial value violates bounds: " + name_);
    }
}

const std::string& Parameter::name() const noexcept {
    return name_;
}

double Parameter::value() const noexcept {
    return value_;
}

void Parameter::set_value(double value) {
    if (!std::isfinite(value) || !within_bounds(value)) {
        throw std::out_of_range("value violates bounds: " + name_);
    }
    value_ = value;
}

double Parameter::lower_bound() const noexcept {
    return lower_bound_;
}

double Parameter::upper_bound() const noexcept {
    return upper_bound_;
}

bool Parameter::is_bounded() const noexcept {
    return std::isfinite(lower_bound_) || std::isfinite(upper_bound_);
}

bool Parameter::within_bounds(double value) const noexcept {
    return value >= lower_bound_ && value <= upper_bound_;
}

double Parameter::project(double value) const noexcept {
    return std::clamp(value, lower_bound_, upper_bound_);
}

bool Parameter::at_bound(double value, double tolerance) const noexcept {
    const bool at_lower = std::isfinite(lower_bound_) && value - lower_bound_ <= tolerance;
    const bool at_upper = std::isfinite(upper_bound_) && upper_bound_ - value <= tolerance;
    return at_lower || at_upper;
}

}  // namespace libctsm
