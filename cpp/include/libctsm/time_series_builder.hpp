#pragma once

#include "libctsm/model_types.hpp"

#include <string>
#include <vector>

namespace libctsm {

// Wide-format panel: one row per subject, one column per measurement
// occasion. Missing entries are NaN (kMissing).
struct WideTable {
    std::vector<std::string> ids;  // optional; row index is used when empty
    std::vector<std::vector<double>> values;
    std::vector<std::vector<double>> ages;
};

/**
 * Builds one subject's observation series from its wide-format record.
 *
 * Occasions where either the value or the age is missing are dropped; the
 * remaining ones keep their chronological order and their source column in
 * Observation::occasion. A record without any complete occasion yields an
 * empty series.
 *
 * @throws InvalidRecord when the vectors differ in length, an entry is
 *         infinite, an age is negative, or retained ages are not strictly
 *         increasing.
 */
[[nodiscard]] SubjectSeries build_subject_series(std::string id,
                                                 const std::vector<double>& values,
                                                 const std::vector<double>& ages);

// Applies build_subject_series to every row; fails on the first malformed row.
[[nodiscard]] std::vector<SubjectSeries> build_panel(const WideTable& table);

[[nodiscard]] std::size_t total_observations(const std::vector<SubjectSeries>& series) noexcept;

}  // namespace libctsm
