#include "libctsm/parameter_catalog.hpp"

#include <stdexcept>

namespace libctsm {

std::size_t ParameterCatalog::register_parameter(const std::string& name,
                                                 double initial_value,
                                                 double lower_bound,
                                                 double upper_bound) {
    if (name.empty()) {
        throw std::invalid_argument("parameter name must be non-empty");
    }

    auto it = index_.find(name);
    if (it != index_.end()) {
        const auto& existing = parameters_[it->second];
        if (existing.lower_bound() != lower_bound || existing.upper_bound() != upper_bound) {
            throw std::invalid_argument("parameter registered with conflicting bounds: " + name);
        }
        return it->second;
    }

    parameters_.emplace_back(name, initial_value, lower_bound, upper_bound);
    names_.push_back(name);
    std::size_t idx = parameters_.size() - 1;
    index_.emplace(name, idx);
    return idx;
}

void ParameterCatalog::set_initial_value(const std::string& name, double value) {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::invalid_argument("unknown parameter: " + name);
    }
    parameters_[it->second].set_value(value);
}

std::size_t ParameterCatalog::size() const noexcept {
    return parameters_.size();
}

bool ParameterCatalog::contains(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::size_t ParameterCatalog::find_index(const std::string& name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return npos;
    }
    return it->second;
}

const Parameter& ParameterCatalog::at(std::size_t index) const {
    if (index >= parameters_.size()) {
        throw std::out_of_range("parameter index out of range");
    }
    return parameters_[index];
}

const std::vector<std::string>& ParameterCatalog::names() const noexcept {
    return names_;
}

std::vector<double> ParameterCatalog::initial_values() const {
    std::vector<double> values(parameters_.size());
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        values[i] = parameters_[i].value();
    }
    return values;
}

std::vector<double> ParameterCatalog::lower_bounds() const {
    std::vector<double> bounds(parameters_.size());
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        bounds[i] = parameters_[i].lower_bound();
    }
    return bounds;
}

std::vector<double> ParameterCatalog::upper_bounds() const {
    std::vector<double> bounds(parameters_.size());
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        bounds[i] = parameters_[i].upper_bound();
    }
    return bounds;
}

std::vector<double> ParameterCatalog::project(const std::vector<double>& values) const {
    if (values.size() != parameters_.size()) {
        throw std::invalid_argument("parameter vector size mismatch");
    }
    std::vector<double> projected(parameters_.size());
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        projected[i] = parameters_[i].project(values[i]);
    }
    return projected;
}

std::vector<bool> ParameterCatalog::at_bounds(const std::vector<double>& values, double tolerance) const {
    if (values.size() != parameters_.size()) {
        throw std::invalid_argument("parameter vector size mismatch");
    }
    std::vector<bool> flags(parameters_.size());
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        flags[i] = parameters_[i].at_bound(values[i], tolerance);
    }
    return flags;
}

}  // namespace libctsm
