#include "wfss_contam/dispersion/observation.hpp"
#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <utility>

namespace wfss_contam::dispersion {

Observation::Observation(std::vector<Source> sources, int rows, int cols,
                         std::shared_ptr<const GrismTransform> transform,
                         int max_workers, DispersionOptions options)
    : sources_(std::move(sources)), rows_(rows), cols_(cols),
      transform_(std::move(transform)), max_workers_(max_workers),
      options_(options) {
  if (!transform_) {
    throw ValidationError("observation requires a grism transform");
  }
  if (rows_ < 1 || cols_ < 1) {
    throw ValidationError("frame dimensions must be >= 1");
  }
  if (max_workers_ < 1) {
    throw ValidationError("max_workers must be >= 1");
  }
  if (options_.oversample <= 0.0 || options_.min_samples < 2 ||
      options_.max_samples < options_.min_samples) {
    throw ValidationError("invalid dispersion sampling options");
  }
  for (size_t i = 0; i < sources_.size(); ++i) {
    const int id = sources_[i].id();
    if (!index_by_id_.emplace(id, i).second) {
      throw ValidationError("duplicate source id " + std::to_string(id));
    }
  }
  simulated_image_ = Matrix2Dd::Zero(rows_, cols_);
}

size_t Observation::index_of(int source_id) const {
  auto it = index_by_id_.find(source_id);
  if (it == index_by_id_.end()) {
    throw LookupError("unknown source id " + std::to_string(source_id));
  }
  return it->second;
}

const Source &Observation::source_by_id(int source_id) const {
  return sources_[index_of(source_id)];
}

std::vector<int> Observation::ids() const {
  std::vector<int> out;
  out.reserve(sources_.size());
  for (const auto &s : sources_) {
    out.push_back(s.id());
  }
  return out;
}

void Observation::disperse_all(const OrderSetup &setup,
                               const OffsetTable &offsets,
                               const core::Diagnostics &diag) {
  validate_order_setup(setup, *transform_);

  // Resolve every placement before any work starts
  std::vector<std::pair<size_t, PixelOffset>> work;
  work.reserve(sources_.size());
  for (size_t i = 0; i < sources_.size(); ++i) {
    if (!sources_[i].has_order(setup.order)) continue;
    work.emplace_back(i, lookup_offset(offsets, sources_[i].id()));
  }

  const int n_workers = std::max(
      1, std::min(max_workers_, static_cast<int>(work.size())));

  std::vector<Matrix2Dd> partials(static_cast<size_t>(n_workers));
  std::vector<DispersionStats> partial_stats(static_cast<size_t>(n_workers));
  std::vector<std::exception_ptr> errors(static_cast<size_t>(n_workers));
  std::atomic<bool> failed{false};

  auto worker = [&](int w) {
    const size_t wi = static_cast<size_t>(w);
    try {
      partials[wi] = Matrix2Dd::Zero(rows_, cols_);
      for (size_t k = wi; k < work.size(); k += static_cast<size_t>(n_workers)) {
        if (failed.load(std::memory_order_relaxed)) {
          break;
        }
        const Source &src = sources_[work[k].first];
        partial_stats[wi] += disperse_source(src, setup, work[k].second,
                                             *transform_, partials[wi],
                                             options_);
      }
    } catch (...) {
      errors[wi] = std::current_exception();
      failed.store(true, std::memory_order_relaxed);
    }
  };

  if (n_workers > 1) {
    core::run_workers(n_workers, worker);
  } else {
    worker(0);
  }

  for (const auto &err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }

  Matrix2Dd composite = std::move(partials[0]);
  DispersionStats stats = partial_stats[0];
  for (size_t w = 1; w < partials.size(); ++w) {
    composite += partials[w];
    stats += partial_stats[w];
  }

  simulated_image_ = std::move(composite);
  last_stats_ = stats;

  diag.event("dispersion_summary",
             {{"order", setup.order},
              {"sources", static_cast<int>(work.size())},
              {"workers", n_workers},
              {"elements", stats.elements},
              {"deposited_flux", stats.deposited_flux},
              {"lost_flux", stats.lost_flux}});
  report(stats, setup.order, "all sources", diag);
}

ChunkResult Observation::disperse_chunk(int source_id, const OrderSetup &setup,
                                        const PixelOffset &offset,
                                        const core::Diagnostics &diag) const {
  const Source &src = sources_[index_of(source_id)];
  validate_order_setup(setup, *transform_);

  ChunkResult chunk;
  chunk.source_id = source_id;
  chunk.order = setup.order;
  chunk.image = Matrix2Dd::Zero(rows_, cols_);
  if (src.has_order(setup.order)) {
    chunk.stats = disperse_source(src, setup, offset, *transform_, chunk.image,
                                  options_);
  }
  report(chunk.stats, setup.order, "source " + std::to_string(source_id),
         diag);
  return chunk;
}

void Observation::report(const DispersionStats &stats, int order,
                         const std::string &who,
                         const core::Diagnostics &diag) const {
  if (stats.nonfinite_positions > 0) {
    diag.warning("order " + std::to_string(order) + ", " + who + ": skipped " +
                 std::to_string(stats.nonfinite_positions) +
                 " elements with non-finite detector positions");
  }
  if (stats.negative_pixels > 0) {
    diag.warning("order " + std::to_string(order) + ", " + who + ": " +
                 std::to_string(stats.negative_pixels) +
                 " negative template pixels treated as zero flux");
  }
}

} // namespace wfss_contam::dispersion
