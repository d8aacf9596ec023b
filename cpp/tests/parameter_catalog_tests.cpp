#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

#include "libctsm/parameter.hpp"
#include "libctsm/parameter_catalog.hpp"

TEST_CASE("ParameterCatalog registers parameters once", "[parameter_catalog]") {
    libctsm::ParameterCatalog catalog;
    auto idx0 = catalog.register_parameter("b_y", -0.2, -1.0, 0.0);
    auto idx1 = catalog.register_parameter("MerY", 2.0, 0.0);
    auto idx0_dup = catalog.register_parameter("b_y", -0.5, -1.0, 0.0);

    REQUIRE(idx0 == 0);
    REQUIRE(idx1 == 1);
    REQUIRE(idx0_dup == idx0);
    REQUIRE(catalog.size() == 2);
    REQUIRE(catalog.contains("b_y"));
    REQUIRE_FALSE(catalog.contains("theta"));
    REQUIRE(catalog.find_index("MerY") == 1);
    REQUIRE(catalog.find_index("theta") == libctsm::ParameterCatalog::npos);
    // The first registration keeps its initial value.
    REQUIRE(catalog.initial_values()[0] == Catch::Approx(-0.2));
}

TEST_CASE("ParameterCatalog rejects conflicting bounds", "[parameter_catalog]") {
    libctsm::ParameterCatalog catalog;
    catalog.register_parameter("MerY", 2.0, 0.0);
    REQUIRE_THROWS_AS(catalog.register_parameter("MerY", 2.0, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(catalog.register_parameter("", 1.0), std::invalid_argument);
}

TEST_CASE("ParameterCatalog exposes bounds and projects into the box", "[parameter_catalog]") {
    constexpr double kInf = std::numeric_limits<double>::infinity();
    libctsm::ParameterCatalog catalog;
    catalog.register_parameter("b_y", -0.2, -1.0, 0.0);
    catalog.register_parameter("yInMn", 12.0);
    catalog.register_parameter("yInV", 25.0, 0.0);

    REQUIRE(catalog.lower_bounds() == std::vector<double>{-1.0, -kInf, 0.0});
    REQUIRE(catalog.upper_bounds() == std::vector<double>{0.0, kInf, kInf});

    auto projected = catalog.project({0.5, -100.0, -3.0});
    REQUIRE(projected[0] == Catch::Approx(0.0));
    REQUIRE(projected[1] == Catch::Approx(-100.0));
    REQUIRE(projected[2] == Catch::Approx(0.0));

    auto flags = catalog.at_bounds({-1.0, 5.0, 1e-9}, 1e-6);
    REQUIRE(flags[0]);
    REQUIRE_FALSE(flags[1]);
    REQUIRE(flags[2]);

    REQUIRE_THROWS_AS(catalog.project({0.0}), std::invalid_argument);
}

TEST_CASE("ParameterCatalog updates initial values within bounds", "[parameter_catalog]") {
    libctsm::ParameterCatalog catalog;
    catalog.register_parameter("ySlV", 0.7, 0.0);
    catalog.set_initial_value("ySlV", 1.5);
    REQUIRE(catalog.at(0).value() == Catch::Approx(1.5));
    REQUIRE_THROWS_AS(catalog.set_initial_value("ySlV", -1.0), std::out_of_range);
    REQUIRE_THROWS_AS(catalog.set_initial_value("missing", 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(catalog.at(3), std::out_of_range);
}

TEST_CASE("Parameter validates its bounds", "[parameter]") {
    REQUIRE_THROWS_AS(libctsm::Parameter("", 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(libctsm::Parameter("p", 0.0, 1.0, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(libctsm::Parameter("p", 2.0, -1.0, 1.0), std::out_of_range);

    libctsm::Parameter p("p", 0.5, 0.0, 1.0);
    REQUIRE(p.is_bounded());
    REQUIRE(p.within_bounds(1.0));
    REQUIRE_FALSE(p.within_bounds(1.5));
    REQUIRE(p.project(-3.0) == Catch::Approx(0.0));
    REQUIRE(p.at_bound(1.0 - 1e-9, 1e-6));
    REQUIRE_FALSE(p.at_bound(0.5, 1e-6));

    libctsm::Parameter free("q", 3.0);
    REQUIRE_FALSE(free.is_bounded());
    REQUIRE_FALSE(free.at_bound(1e12, 1e-6));
}
