#include "test_helpers.hpp"

#include "wfss_contam/contam/contam_corr.hpp"
#include "wfss_contam/contam/slit.hpp"
#include "wfss_contam/core/errors.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wfss_contam;
using namespace wfss_contam::testing;
using contam::SlitCutout;
using dispersion::PixelOffset;

namespace {

// Two single-pixel sources of unit flux; each trace runs 10 px along +x
contam::ContamInputs two_sources(PixelOffset a, PixelOffset b) {
    contam::ContamInputs in;
    in.sources.emplace_back(1, constant(1, 1, 1.0f), std::vector<int>{1});
    in.sources.emplace_back(2, constant(1, 1, 1.0f), std::vector<int>{1});
    in.segment_offsets = {{1, a}, {2, b}};
    in.transform = linear_transform(10.0);
    in.tables = unit_tables();
    return in;
}

// Non-zero pixels of `m` all lie on `row` within columns [c0, c1]
bool nonzero_only_within(const Matrix2Df &m, int row, int c0, int c1) {
    for (int r = 0; r < m.rows(); ++r) {
        for (int c = 0; c < m.cols(); ++c) {
            const bool inside = r == row && c >= c0 && c <= c1;
            if (!inside && m(r, c) != 0.0f) return false;
        }
    }
    return true;
}

std::vector<SlitCutout> two_slits() {
    std::vector<SlitCutout> slits;
    slits.push_back(make_slit(1, 0, 3, 30, 5, 2.0f));
    slits.push_back(make_slit(2, 0, 18, 30, 5, 2.0f));
    return slits;
}

} // namespace

TEST_CASE("check_window_accepts_edge_and_rejects_one_past") {
    REQUIRE_NOTHROW(contam::check_window({50, 25, 10, 5}, 30, 60));
    REQUIRE_NOTHROW(contam::check_window({0, 0, 60, 30}, 30, 60));
    REQUIRE_THROWS_AS(contam::check_window({51, 25, 10, 5}, 30, 60), BoundsError);
    REQUIRE_THROWS_AS(contam::check_window({50, 26, 10, 5}, 30, 60), BoundsError);
    REQUIRE_THROWS_AS(contam::check_window({-1, 0, 10, 5}, 30, 60), BoundsError);
}

TEST_CASE("slit_data_must_match_window") {
    contam::SlitMeta meta;
    meta.source_id = 1;
    REQUIRE_THROWS_AS(SlitCutout({0, 0, 4, 3}, constant(4, 3, 0.0f), meta), ValidationError);
    REQUIRE_THROWS_AS(SlitCutout({0, 0, 0, 3}, Matrix2Df(3, 0), meta), ValidationError);

    SlitCutout ok({0, 0, 4, 3}, constant(3, 4, 1.0f), meta);
    REQUIRE_THROWS_AS(ok.subtract(constant(4, 3, 1.0f)), ValidationError);
}

TEST_CASE("copy_slit_info_keeps_window_and_metadata") {
    auto tr = linear_transform();
    SlitCutout src = make_slit(7, 3, 4, 5, 2, 1.0f);
    contam::SlitMeta meta = src.meta();
    meta.wcs = tr;
    meta.dispersion_direction = 2;
    SlitCutout with_wcs(src.window(), src.data(), meta);

    SlitCutout copy = contam::copy_slit_info(with_wcs, constant(2, 5, 9.0f));
    REQUIRE(copy.meta().name == "slit7");
    REQUIRE(copy.source_id() == 7);
    REQUIRE(copy.meta().source_type == "POINT");
    REQUIRE(copy.meta().dispersion_direction == 2);
    REQUIRE(copy.meta().wcs.get() == tr.get());
    REQUIRE(copy.window().xstart == 3);
    REQUIRE(copy.window().ystart == 4);
    REQUIRE(copy.data()(1, 4) == 9.0f);
}

TEST_CASE("non_overlapping_sources_leave_slits_unchanged") {
    auto slits = two_slits();
    auto result = contam::contam_corr(slits, two_sources({5, 5}, {5, 20}), small_config());

    REQUIRE(result.status == CalStepStatus::COMPLETE);
    REQUIRE(result.corrected.size() == 2);
    REQUIRE(result.contamination.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        REQUIRE(result.contamination[i].data().cwiseAbs().maxCoeff() < 1e-6f);
        REQUIRE((result.corrected[i].data() - slits[i].data()).cwiseAbs().maxCoeff() < 1e-6f);
    }
    REQUIRE(result.simulated.rows() == 30);
    REQUIRE(result.simulated.cols() == 60);
    REQUIRE(result.simulated.sum() == Catch::Approx(2.0).epsilon(1e-5));
}

TEST_CASE("overlapping_source_flux_is_removed_from_the_other_slit") {
    // Source 2 starts 3 px right of source 1 on the same row
    std::vector<SlitCutout> slits;
    slits.push_back(make_slit(1, 0, 3, 30, 5, 2.0f));
    auto result = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), small_config());

    const auto &contam_slit = result.contamination[0];
    REQUIRE(contam_slit.source_id() == 1);
    REQUIRE(contam_slit.window().ystart == 3);
    REQUIRE(contam_slit.data().sum() == Catch::Approx(1.0).epsilon(1e-5));
    // Trace of source 2 lies on detector row 5 = slit row 2
    REQUIRE(contam_slit.data().row(2).sum() == Catch::Approx(1.0).epsilon(1e-5));
    REQUIRE(contam_slit.data().row(0).cwiseAbs().maxCoeff() < 1e-6f);

    const Matrix2Df expected = slits[0].data() - contam_slit.data();
    REQUIRE((result.corrected[0].data() - expected).cwiseAbs().maxCoeff() == 0.0f);
    REQUIRE(result.corrected[0].data().sum() ==
            Catch::Approx(slits[0].data().sum() - 1.0).epsilon(1e-5));
}

TEST_CASE("overlapping_windows_each_see_the_other_trace") {
    // Traces on detector row 5: source 1 covers x 5..15, source 2 x 8..18
    std::vector<SlitCutout> slits;
    slits.push_back(make_slit(1, 0, 3, 30, 5, 2.0f));
    slits.push_back(make_slit(2, 5, 3, 30, 5, 2.0f));
    auto result = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), small_config());

    REQUIRE(result.contamination.size() == 2);
    const Matrix2Df &c1 = result.contamination[0].data();
    const Matrix2Df &c2 = result.contamination[1].data();

    // Slit 1 sees source 2 at window columns 8..18
    REQUIRE(c1.sum() == Catch::Approx(1.0).epsilon(1e-5));
    REQUIRE(nonzero_only_within(c1, 2, 8, 18));
    REQUIRE(c1(2, 12) > 0.0f);

    // Slit 2 starts at x = 5 and sees source 1 at window columns 0..10
    REQUIRE(c2.sum() == Catch::Approx(1.0).epsilon(1e-5));
    REQUIRE(nonzero_only_within(c2, 2, 0, 10));
    REQUIRE(c2(2, 5) > 0.0f);

    for (size_t i = 0; i < 2; ++i) {
        const Matrix2Df expected = slits[i].data() - result.contamination[i].data();
        REQUIRE((result.corrected[i].data() - expected).cwiseAbs().maxCoeff() == 0.0f);
    }
}

TEST_CASE("contam_corr_leaves_input_untouched_and_is_repeatable") {
    auto slits = two_slits();
    const Matrix2Df original = slits[0].data();

    auto first = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), small_config());
    auto second = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), small_config());

    REQUIRE((slits[0].data().array() == original.array()).all());
    for (size_t i = 0; i < slits.size(); ++i) {
        REQUIRE((first.corrected[i].data().array() == second.corrected[i].data().array()).all());
    }
}

TEST_CASE("worker_count_does_not_change_the_correction") {
    auto slits = two_slits();
    auto cfg = small_config();
    auto serial = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg);
    cfg.contam.max_cores = "all";
    auto parallel = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg);

    REQUIRE(parallel.workers >= 1);
    for (size_t i = 0; i < slits.size(); ++i) {
        REQUIRE((serial.corrected[i].data() - parallel.corrected[i].data()).cwiseAbs().maxCoeff() <
                1e-5f);
    }
}

TEST_CASE("slit_window_past_frame_edge_is_bounds_error") {
    auto cfg = small_config();

    std::vector<SlitCutout> edge;
    edge.push_back(make_slit(1, 30, 25, 30, 5));
    REQUIRE_NOTHROW(contam::contam_corr(edge, two_sources({5, 5}, {8, 5}), cfg));

    std::vector<SlitCutout> past;
    past.push_back(make_slit(1, 31, 25, 30, 5));
    REQUIRE_THROWS_AS(contam::contam_corr(past, two_sources({5, 5}, {8, 5}), cfg), BoundsError);
}

TEST_CASE("disabled_or_empty_input_is_skipped") {
    auto slits = two_slits();
    auto cfg = small_config();
    cfg.contam.enabled = false;

    auto result = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg);
    REQUIRE(result.status == CalStepStatus::SKIPPED);
    REQUIRE(result.contamination.empty());
    REQUIRE(result.corrected.size() == slits.size());
    REQUIRE((result.corrected[0].data().array() == slits[0].data().array()).all());
    REQUIRE(result.simulated.rows() == 30);
    REQUIRE(result.simulated.cwiseAbs().maxCoeff() == 0.0f);

    auto empty = contam::contam_corr({}, two_sources({5, 5}, {8, 5}), small_config());
    REQUIRE(empty.status == CalStepStatus::SKIPPED);
    REQUIRE(empty.corrected.empty());
}

TEST_CASE("slit_placement_uses_slit_origin") {
    // Segment origins overlap; slit origins separate the two sources
    std::vector<SlitCutout> slits;
    slits.push_back(make_slit(1, 5, 3, 20, 5));
    slits.push_back(make_slit(2, 40, 20, 15, 3));

    auto cfg = small_config();
    auto by_segment = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg);
    REQUIRE(by_segment.contamination[0].data().sum() == Catch::Approx(1.0).epsilon(1e-5));

    cfg.contam.placement = "slit";
    auto by_slit = contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg);
    REQUIRE(by_slit.contamination[0].data().cwiseAbs().maxCoeff() < 1e-6f);
    REQUIRE(by_slit.contamination[1].data().cwiseAbs().maxCoeff() < 1e-6f);

    auto offsets = contam::placement_offsets(PlacementMode::SLIT, slits, {{3, {1, 1}}});
    REQUIRE(offsets.at(2).x == 40);
    REQUIRE(offsets.at(2).y == 20);
    REQUIRE(offsets.count(3) == 0);
}

TEST_CASE("slit_placement_requires_a_slit_for_every_source") {
    std::vector<SlitCutout> slits;
    slits.push_back(make_slit(1, 20, 10, 20, 5));

    auto cfg = small_config();
    cfg.contam.placement = "slit";
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      LookupError);

    cfg.contam.placement = "segmentation";
    REQUIRE_NOTHROW(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg));
}

TEST_CASE("order_setup_resolution") {
    config::InstrumentConfig nircam;
    nircam.name = "NIRCAM";
    nircam.filter = "F444W";
    nircam.pupil = "GRISMR";

    auto setups = contam::resolve_order_setups(unit_tables(), nircam);
    REQUIRE(setups.size() == 1);
    REQUIRE(setups.at(1).wmin == 1.0);
    REQUIRE(setups.at(1).wmax == 2.0);

    reference::ReferenceTables niriss_tables;
    niriss_tables.wavelength_ranges.add("F200W", 1, 1.75, 2.25);
    niriss_tables.wavelength_ranges.add("F200W", -1, 1.75, 2.25);
    niriss_tables.sensitivity.add("GR150R", "F200W", 1,
                                  reference::SensitivityCurve::flat(1.7, 2.3, 2.0));
    niriss_tables.sensitivity.add("GR150R", "F200W", -1,
                                  reference::SensitivityCurve::flat(1.7, 2.3, 0.5));
    config::InstrumentConfig niriss;
    niriss.name = "NIRISS";
    niriss.filter = "GR150R";
    niriss.pupil = "F200W";
    auto ni = contam::resolve_order_setups(niriss_tables, niriss);
    REQUIRE(ni.size() == 2);
    REQUIRE(ni.at(-1).sensitivity.response_at(2.0) == Catch::Approx(0.5));

    REQUIRE_THROWS_AS(contam::resolve_order_setups(reference::ReferenceTables{}, nircam),
                      ConfigError);

    nircam.pupil = "GRISMC";
    REQUIRE_THROWS_AS(contam::resolve_order_setups(unit_tables(), nircam), LookupError);
}

TEST_CASE("invalid_configuration_fails_before_dispersion") {
    auto slits = two_slits();

    auto cfg = small_config();
    cfg.contam.max_cores = "most";
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      ConfigError);

    cfg = small_config();
    cfg.contam.placement = "centroid";
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      ConfigError);

    cfg = small_config();
    cfg.contam.min_samples = 1;
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      ConfigError);

    cfg = small_config();
    cfg.contam.oversample = 0.0;
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      ConfigError);

    cfg = small_config();
    cfg.frame.width = 0;
    REQUIRE_THROWS_AS(contam::contam_corr(slits, two_sources({5, 5}, {8, 5}), cfg),
                      ConfigError);

    std::vector<SlitCutout> unknown;
    unknown.push_back(make_slit(42, 0, 0, 10, 5));
    REQUIRE_THROWS_AS(contam::contam_corr(unknown, two_sources({5, 5}, {8, 5}), small_config()),
                      LookupError);
}
