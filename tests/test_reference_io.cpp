#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/io/reference_io.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wfss_contam;

TEST_CASE("reference_yaml_builds_tables_and_transform") {
    YAML::Node node = YAML::Load(R"(
wavelength_range:
  - {filter: F444W, order: 1, wmin: 3.8, wmax: 5.1}
  - {filter: F444W, order: 2, wmin: 2.4, wmax: 2.6}
  - {filter: F444W, order: 0, wmin: 0.6, wmax: 5.3}
sensitivity:
  - {filter: F444W, pupil: GRISMR, order: 1, wavelength: [3.8, 4.4, 5.1], response: [1.0, 2.0, 1.0]}
  - {filter: F444W, pupil: GRISMR, order: 2, wavelength: [2.4, 2.6], response: [0.3, 0.3]}
trace:
  - {order: 1, wavelength_ref: 4.4, dx: [0.0, 1000.0], dy: [0.0]}
  - {order: 2, wavelength_ref: 2.5, dx: [10.0, 2000.0], dy: [1.0]}
)");

    auto bundle = io::reference_from_yaml(node);
    const std::vector<int> expected{1, 2};
    REQUIRE(bundle.tables.wavelength_ranges.orders() == expected);
    REQUIRE(bundle.tables.wavelength_ranges.get("F444W", 2).wmax == Catch::Approx(2.6));
    REQUIRE(bundle.tables.sensitivity.get("F444W", "GRISMR", 1).response_at(4.1) ==
            Catch::Approx(1.5));

    REQUIRE(bundle.transform.get() != nullptr);
    auto p = bundle.transform->to_detector(100.0, 50.0, 4.5, 1);
    REQUIRE(p.x == Catch::Approx(200.0));
    REQUIRE(p.y == Catch::Approx(50.0));
    REQUIRE(bundle.transform->has_order(2));
}

TEST_CASE("reference_yaml_reports_missing_keys") {
    YAML::Node node = YAML::Load(R"(
wavelength_range:
  - {filter: F444W, order: 1, wmin: 3.8}
)");
    REQUIRE_THROWS_AS(io::reference_from_yaml(node), ConfigError);

    YAML::Node inverted = YAML::Load(R"(
wavelength_range:
  - {filter: F444W, order: 1, wmin: 5.1, wmax: 3.8}
)");
    REQUIRE_THROWS_AS(io::reference_from_yaml(inverted), ValidationError);

    REQUIRE_THROWS_AS(io::load_reference("/nonexistent/reference.yaml"), ConfigError);
}
