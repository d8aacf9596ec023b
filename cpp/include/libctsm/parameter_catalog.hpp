#pragma once

#include "libctsm/parameter.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace libctsm {

class ParameterCatalog {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    std::size_t register_parameter(const std::string& name,
                                   double initial_value,
                                   double lower_bound = -std::numeric_limits<double>::infinity(),
                                   double upper_bound = std::numeric_limits<double>::infinity());

    void set_initial_value(const std::string& name, double value);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_index(const std::string& name) const noexcept;

    [[nodiscard]] const Parameter& at(std::size_t index) const;

    [[nodiscard]] const std::vector<std::string>& names() const noexcept;

    [[nodiscard]] std::vector<double> initial_values() const;

    [[nodiscard]] std::vector<double> lower_bounds() const;

    [[nodiscard]] std::vector<double> upper_bounds() const;

    [[nodiscard]] std::vector<double> project(const std::vector<double>& values) const;

    [[nodiscard]] std::vector<bool> at_bounds(const std::vector<double>& values, double tolerance) const;

private:
    std::vector<Parameter> parameters_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace libctsm
