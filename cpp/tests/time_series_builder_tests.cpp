#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

#include "libctsm/errors.hpp"
#include "libctsm/time_series_builder.hpp"

namespace {
constexpr double NA = libctsm::kMissing;
}  // namespace

TEST_CASE("Missing occasions are dropped and the rest keep their order", "[time_series]") {
    const auto series = libctsm::build_subject_series("s1", {10.0, NA, 13.0, 14.0}, {0.0, 1.0, 2.0, NA});
    REQUIRE(series.id == "s1");
    REQUIRE(series.size() == 2);
    REQUIRE(series.observations[0].time == Catch::Approx(0.0));
    REQUIRE(series.observations[0].value == Catch::Approx(10.0));
    REQUIRE(series.observations[0].occasion == 0);
    REQUIRE(series.observations[1].time == Catch::Approx(2.0));
    REQUIRE(series.observations[1].value == Catch::Approx(13.0));
    REQUIRE(series.observations[1].occasion == 2);
}

TEST_CASE("Irregular ages are kept exactly", "[time_series]") {
    const auto series = libctsm::build_subject_series("s2", {1.0, 2.0, 3.0}, {0.25, 1.7, 4.05});
    REQUIRE(series.size() == 3);
    REQUIRE(series.observations[1].time == 1.7);
    REQUIRE(series.observations[2].time == 4.05);
}

TEST_CASE("A record without complete occasions yields an empty series", "[time_series]") {
    const auto series = libctsm::build_subject_series("s3", {NA, 5.0}, {1.0, NA});
    REQUIRE(series.empty());
    REQUIRE(series.size() == 0);
}

TEST_CASE("Malformed records are rejected", "[time_series]") {
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0, 2.0}, {0.0}), libctsm::InvalidRecord);
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0, 2.0}, {1.0, 1.0}), libctsm::InvalidRecord);
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0, 2.0}, {2.0, 1.0}), libctsm::InvalidRecord);
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0}, {-0.5}), libctsm::InvalidRecord);
    REQUIRE_THROWS_AS(
        libctsm::build_subject_series("bad", {std::numeric_limits<double>::infinity()}, {1.0}),
        libctsm::InvalidRecord);
    // InvalidRecord is an invalid_argument
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0}, {}), std::invalid_argument);
}

TEST_CASE("Non-increasing ages are checked across gaps", "[time_series]") {
    REQUIRE_THROWS_AS(libctsm::build_subject_series("bad", {1.0, NA, 2.0}, {3.0, 4.0, 2.0}), libctsm::InvalidRecord);
    REQUIRE_NOTHROW(libctsm::build_subject_series("ok", {1.0, NA, 2.0}, {3.0, 2.0, 4.0}));
}

TEST_CASE("Wide tables become one series per row", "[time_series]") {
    libctsm::WideTable table;
    table.values = {{10.0, 11.0, 13.0}, {10.0, 9.0, 8.0}, {NA, NA, NA}};
    table.ages = {{0.0, 1.0, 2.0}, {0.0, 1.0, 2.0}, {0.0, 1.0, 2.0}};

    const auto panel = libctsm::build_panel(table);
    REQUIRE(panel.size() == 3);
    REQUIRE(panel[0].id == "0");
    REQUIRE(panel[2].id == "2");
    REQUIRE(panel[2].empty());
    REQUIRE(libctsm::total_observations(panel) == 6);

    table.ids = {"a", "b", "c"};
    REQUIRE(libctsm::build_panel(table)[1].id == "b");

    table.ids = {"a"};
    REQUIRE_THROWS_AS(libctsm::build_panel(table), libctsm::InvalidRecord);

    table.ids.clear();
    table.ages.pop_back();
    REQUIRE_THROWS_AS(libctsm::build_panel(table), libctsm::InvalidRecord);
}
