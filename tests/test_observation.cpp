#include "test_helpers.hpp"

#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/dispersion/observation.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wfss_contam;
using namespace wfss_contam::testing;
using dispersion::Observation;
using dispersion::OffsetTable;
using dispersion::PixelOffset;
using dispersion::Source;

namespace {

std::vector<Source> three_sources() {
    Matrix2Df a(2, 2);
    a << 1.0f, 2.0f,
         3.0f, 4.0f;
    Matrix2Df b(1, 3);
    b << 0.5f, 5.0f, 0.5f;
    Matrix2Df c(3, 1);
    c << 2.0f, 7.0f, 2.0f;

    std::vector<Source> out;
    out.emplace_back(1, a, std::vector<int>{1});
    out.emplace_back(2, b, std::vector<int>{1});
    out.emplace_back(3, c, std::vector<int>{1});
    return out;
}

OffsetTable three_offsets() {
    // Sources 1 and 2 share rows so their traces overlap
    return {{1, PixelOffset{4, 6}}, {2, PixelOffset{9, 6}}, {3, PixelOffset{2, 14}}};
}

} // namespace

TEST_CASE("disperse_all_does_not_depend_on_source_order_or_workers") {
    auto tr = linear_transform(12.5);

    Observation serial(three_sources(), 24, 48, tr, 1, small_options());
    serial.disperse_all(unit_setup(), three_offsets());
    const Matrix2Dd reference_image = serial.simulated_image();
    REQUIRE(reference_image.sum() > 0.0);

    auto reversed = three_sources();
    std::reverse(reversed.begin(), reversed.end());
    Observation permuted(std::move(reversed), 24, 48, tr, 1, small_options());
    permuted.disperse_all(unit_setup(), three_offsets());
    REQUIRE(max_abs_diff(permuted.simulated_image(), reference_image) < 1e-9);

    for (int workers : {2, 3, 8}) {
        Observation parallel(three_sources(), 24, 48, tr, workers, small_options());
        parallel.disperse_all(unit_setup(), three_offsets());
        REQUIRE(max_abs_diff(parallel.simulated_image(), reference_image) < 1e-9);
    }
}

TEST_CASE("disperse_all_is_repeatable_for_a_fixed_worker_count") {
    auto tr = linear_transform(12.5);
    Observation obs(three_sources(), 24, 48, tr, 3, small_options());

    obs.disperse_all(unit_setup(), three_offsets());
    const Matrix2Dd first = obs.simulated_image();
    obs.disperse_all(unit_setup(), three_offsets());

    REQUIRE((obs.simulated_image().array() == first.array()).all());
}

TEST_CASE("chunks_sum_to_the_composite") {
    auto tr = linear_transform(12.5);
    Observation obs(three_sources(), 24, 48, tr, 2, small_options());
    const auto offsets = three_offsets();

    obs.disperse_all(unit_setup(), offsets);

    Matrix2Dd sum = Matrix2Dd::Zero(24, 48);
    for (int id : obs.ids()) {
        auto chunk = obs.disperse_chunk(id, unit_setup(), offsets.at(id));
        REQUIRE(chunk.source_id == id);
        REQUIRE(chunk.order == 1);
        sum += chunk.image;
    }
    REQUIRE(max_abs_diff(sum, obs.simulated_image()) < 1e-9);
    REQUIRE(obs.last_stats().elements > 0);
}

TEST_CASE("chunk_of_unassigned_order_is_empty") {
    auto tr = linear_transform(12.5, 1);
    tr->add_trace({2, 1.0, {0.0, 6.0}, {1.0}});

    std::vector<Source> sources;
    sources.emplace_back(1, constant(1, 1, 1.0f), std::vector<int>{1});
    sources.emplace_back(2, constant(1, 1, 1.0f), std::vector<int>{1, 2});
    Observation obs(std::move(sources), 10, 30, tr, 1, small_options());

    OffsetTable offsets{{1, PixelOffset{1, 2}}, {2, PixelOffset{1, 6}}};
    obs.disperse_all(unit_setup(2), offsets);

    auto chunk = obs.disperse_chunk(1, unit_setup(2), offsets.at(1));
    REQUIRE(chunk.image.cwiseAbs().maxCoeff() == 0.0);
    REQUIRE(obs.simulated_image().sum() == Catch::Approx(1.0));
}

TEST_CASE("unknown_source_id_is_lookup_error") {
    Observation obs(three_sources(), 24, 48, linear_transform(), 1, small_options());

    REQUIRE(obs.index_of(2) == 1);
    REQUIRE(obs.source_by_id(3).id() == 3);
    REQUIRE_THROWS_AS(obs.index_of(99), LookupError);
    REQUIRE_THROWS_AS(obs.disperse_chunk(99, unit_setup(), PixelOffset{0, 0}), LookupError);
}

TEST_CASE("missing_offset_aborts_before_any_work") {
    Observation obs(three_sources(), 24, 48, linear_transform(), 2, small_options());
    OffsetTable offsets = three_offsets();
    offsets.erase(2);

    REQUIRE_THROWS_AS(obs.disperse_all(unit_setup(), offsets), LookupError);
    REQUIRE(obs.simulated_image().cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("observation_rejects_invalid_construction") {
    auto dup = three_sources();
    dup.emplace_back(1, constant(1, 1, 1.0f), std::vector<int>{1});
    REQUIRE_THROWS_AS(Observation(std::move(dup), 24, 48, linear_transform(), 1),
                      ValidationError);

    REQUIRE_THROWS_AS(Observation(three_sources(), 24, 48, nullptr, 1), ValidationError);
    REQUIRE_THROWS_AS(Observation(three_sources(), 0, 48, linear_transform(), 1),
                      ValidationError);
    REQUIRE_THROWS_AS(Observation(three_sources(), 24, 48, linear_transform(), 0),
                      ValidationError);
}

TEST_CASE("worker_failure_is_rethrown_and_keeps_previous_image") {
    auto tr = std::make_shared<FailingTransform>();
    std::vector<Source> sources;
    for (int id = 1; id <= 6; ++id) {
        sources.emplace_back(id, constant(1, 1, 1.0f), std::vector<int>{1, 2});
    }
    OffsetTable offsets;
    for (int id = 1; id <= 6; ++id) {
        offsets[id] = PixelOffset{2, 2 * id};
    }

    Observation obs(std::move(sources), 16, 32, tr, 3, small_options());
    obs.disperse_all(unit_setup(1), offsets);
    const Matrix2Dd before = obs.simulated_image();
    REQUIRE(before.sum() == Catch::Approx(6.0));

    REQUIRE_THROWS_AS(obs.disperse_all(unit_setup(2), offsets), std::runtime_error);
    REQUIRE((obs.simulated_image().array() == before.array()).all());
}
