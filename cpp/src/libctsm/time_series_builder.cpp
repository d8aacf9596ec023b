#include "libctsm/time_series_builder.hpp"

#include "libctsm/errors.hpp"

#include <cmath>
#include <utility>

namespace libctsm {

SubjectSeries build_subject_series(std::string id,
                                   const std::vector<double>& values,
                                   const std::vector<double>& ages) {
    if (values.size() != ages.size()) {
        throw InvalidRecord("subject " + id + ": " + std::to_string(values.size()) + " values but " +
                            std::to_string(ages.size()) + " ages");
    }

    SubjectSeries series;
    series.id = std::move(id);
    series.observations.reserve(values.size());

    for (std::size_t occasion = 0; occasion < values.size(); ++occasion) {
        const double value = values[occasion];
        const double age = ages[occasion];
        if (std::isinf(value) || std::isinf(age)) {
            throw InvalidRecord("subject " + series.id + ": infinite entry at occasion " + std::to_string(occasion));
        }
        if (std::isnan(value) || std::isnan(age)) {
            continue;
        }
        if (age < 0.0) {
            throw InvalidRecord("subject " + series.id + ": negative age at occasion " + std::to_string(occasion));
        }
        if (!series.observations.empty() && !(age > series.observations.back().time)) {
            throw InvalidRecord("subject " + series.id + ": ages not strictly increasing at occasion " +
                                std::to_string(occasion));
        }
        series.observations.push_back(Observation{age, value, occasion});
    }
    return series;
}

std::vector<SubjectSeries> build_panel(const WideTable& table) {
    if (table.values.size() != table.ages.size()) {
        throw InvalidRecord("wide table has " + std::to_string(table.values.size()) + " value rows but " +
                            std::to_string(table.ages.size()) + " age rows");
    }
    if (!table.ids.empty() && table.ids.size() != table.values.size()) {
        throw InvalidRecord("wide table id count does not match row count");
    }

    std::vector<SubjectSeries> panel;
    panel.reserve(table.values.size());
    for (std::size_t row = 0; row < table.values.size(); ++row) {
        std::string id = table.ids.empty() ? std::to_string(row) : table.ids[row];
        panel.push_back(build_subject_series(std::move(id), table.values[row], table.ages[row]));
    }
    return panel;
}

std::size_t total_observations(const std::vector<SubjectSeries>& series) noexcept {
    std::size_t total = 0;
    for (const auto& subject : series) {
        total += subject.size();
    }
    return total;
}

}  // namespace libctsm
