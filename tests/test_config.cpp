#include "wfss_contam/config/configuration.hpp"
#include "wfss_contam/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wfss_contam;

TEST_CASE("config_defaults_match_documentation") {
    config::Config cfg;
    REQUIRE(cfg.frame.width == 2048);
    REQUIRE(cfg.frame.height == 2048);
    REQUIRE(cfg.contam.enabled);
    REQUIRE(cfg.contam.max_cores == "none");
    REQUIRE(cfg.contam.placement == "segmentation");
    REQUIRE(cfg.output.write_simulated);
}

TEST_CASE("config_from_yaml_reads_all_sections") {
    YAML::Node node = YAML::Load(R"(
frame:
  width: 512
  height: 256
instrument:
  name: NIRISS
  filter: GR150C
  pupil: F150W
contam:
  enabled: false
  max_cores: half
  placement: slit
  oversample: 3.5
  min_samples: 8
  max_samples: 64
output:
  outputs_dir: products
  write_simulated: false
  write_contam: true
)");

    auto cfg = config::Config::from_yaml(node);
    REQUIRE(cfg.frame.width == 512);
    REQUIRE(cfg.frame.height == 256);
    REQUIRE(cfg.instrument.name == "NIRISS");
    REQUIRE(cfg.instrument.pupil == "F150W");
    REQUIRE_FALSE(cfg.contam.enabled);
    REQUIRE(cfg.contam.max_cores == "half");
    REQUIRE(cfg.contam.placement == "slit");
    REQUIRE(cfg.contam.oversample == Catch::Approx(3.5));
    REQUIRE(cfg.contam.min_samples == 8);
    REQUIRE(cfg.contam.max_samples == 64);
    REQUIRE(cfg.output.outputs_dir == "products");
    REQUIRE_FALSE(cfg.output.write_simulated);
    REQUIRE_NOTHROW(cfg.validate());

    auto again = config::Config::from_yaml(cfg.to_yaml());
    REQUIRE(again.contam.max_cores == "half");
    REQUIRE(again.frame.height == 256);
}

TEST_CASE("config_validate_rejects_unknown_max_cores") {
    config::Config cfg;
    cfg.instrument.filter = "F444W";
    REQUIRE_NOTHROW(cfg.validate());

    cfg.contam.max_cores = "most";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

    cfg.contam.max_cores = " Quarter ";
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_rejects_bad_values") {
    config::Config cfg;
    cfg.instrument.filter = "F444W";

    auto bad = cfg;
    bad.contam.placement = "centroid";
    REQUIRE_THROWS_AS(bad.validate(), ConfigError);

    bad = cfg;
    bad.frame.width = 0;
    REQUIRE_THROWS_AS(bad.validate(), ValidationError);

    bad = cfg;
    bad.contam.oversample = 0.0;
    REQUIRE_THROWS_AS(bad.validate(), ValidationError);

    bad = cfg;
    bad.contam.max_samples = bad.contam.min_samples - 1;
    REQUIRE_THROWS_AS(bad.validate(), ValidationError);

    bad = cfg;
    bad.instrument.filter.clear();
    REQUIRE_THROWS_AS(bad.validate(), ValidationError);
}

TEST_CASE("config_load_missing_file_is_config_error") {
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/wfss_contam.yaml"), ConfigError);
}
