#pragma once

#include "wfss_contam/core/events.hpp"
#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/disperse.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wfss_contam::dispersion {

// One source's full-frame contribution in one order. Recomputed on demand.
struct ChunkResult {
  int source_id = 0;
  int order = 0;
  Matrix2Dd image;
  DispersionStats stats;
};

// Simulates a slitless exposure from a set of sources: a full-frame
// composite per order (disperse_all) and the isolated contribution of any
// single source (disperse_chunk). Both paths run the same dispersion
// routine, so composite - chunk leaves the other sources' flux.
class Observation {
public:
  Observation(std::vector<Source> sources, int rows, int cols,
              std::shared_ptr<const GrismTransform> transform,
              int max_workers = 1, DispersionOptions options = {});

  // Replaces simulated_image() with the sum over every source assigned to
  // setup.order. Work is split over up to max_workers threads, each with its
  // own partial frame; partials are summed in worker order. Any failure is
  // rethrown and leaves the previous simulated_image() in place.
  void disperse_all(const OrderSetup &setup, const OffsetTable &offsets,
                    const core::Diagnostics &diag = {});

  // Throws LookupError for an unknown source id. A source not assigned to
  // setup.order yields an all-zero image, matching its (absent) term in
  // disperse_all.
  ChunkResult disperse_chunk(int source_id, const OrderSetup &setup,
                             const PixelOffset &offset,
                             const core::Diagnostics &diag = {}) const;

  const Matrix2Dd &simulated_image() const { return simulated_image_; }
  const DispersionStats &last_stats() const { return last_stats_; }

  size_t index_of(int source_id) const;
  const Source &source_by_id(int source_id) const;
  std::vector<int> ids() const;

  size_t size() const { return sources_.size(); }
  int rows() const { return rows_; }
  int cols() const { return cols_; }
  int max_workers() const { return max_workers_; }
  const DispersionOptions &options() const { return options_; }

private:
  void report(const DispersionStats &stats, int order, const std::string &who,
              const core::Diagnostics &diag) const;

  std::vector<Source> sources_;
  std::map<int, size_t> index_by_id_;
  int rows_ = 0;
  int cols_ = 0;
  std::shared_ptr<const GrismTransform> transform_;
  int max_workers_ = 1;
  DispersionOptions options_;

  Matrix2Dd simulated_image_;
  DispersionStats last_stats_;
};

} // namespace wfss_contam::dispersion
