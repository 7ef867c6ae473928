#include "wfss_contam/contam/contam_corr.hpp"
#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/core/utils.hpp"
#include "wfss_contam/dispersion/observation.hpp"

#include <utility>

namespace wfss_contam::contam {

std::map<int, dispersion::OrderSetup>
resolve_order_setups(const reference::ReferenceTables &tables,
                     const config::InstrumentConfig &instrument) {
  const std::vector<int> orders = tables.wavelength_ranges.orders();
  if (orders.empty()) {
    throw ConfigError("wavelength range table defines no spectral orders");
  }

  const std::string filter_name = reference::resolve_filter_name(
      instrument.name, instrument.filter, instrument.pupil);

  std::map<int, dispersion::OrderSetup> setups;
  for (int order : orders) {
    const reference::SpectralOrderRange range =
        tables.wavelength_ranges.get(filter_name, order);
    dispersion::OrderSetup setup;
    setup.order = order;
    setup.wmin = range.wmin;
    setup.wmax = range.wmax;
    setup.sensitivity =
        tables.sensitivity.get(instrument.filter, instrument.pupil, order);
    setups.emplace(order, std::move(setup));
  }
  return setups;
}

dispersion::OffsetTable placement_offsets(PlacementMode mode,
                                          const std::vector<SlitCutout> &slits,
                                          const dispersion::OffsetTable &segment_offsets) {
  switch (mode) {
  case PlacementMode::SEGMENTATION:
    return segment_offsets;
  case PlacementMode::SLIT:
    // Slit origins only; a source without a slit has no placement
    return offsets_from_slits(slits);
  default:
    throw ConfigError("unknown placement mode");
  }
}

Matrix2Df contamination_cutout(const Matrix2Dd &composite, const Matrix2Dd &own,
                               const SlitWindow &window) {
  if (own.rows() != composite.rows() || own.cols() != composite.cols()) {
    throw ValidationError("source image shape differs from composite");
  }
  check_window(window, static_cast<int>(composite.rows()),
               static_cast<int>(composite.cols()));

  const Matrix2Dd diff =
      composite.block(window.ystart, window.xstart, window.ysize, window.xsize) -
      own.block(window.ystart, window.xstart, window.ysize, window.xsize);
  return diff.cast<float>();
}

void subtract_contamination(SlitCutout &slit, const Matrix2Df &cutout) {
  slit.subtract(cutout);
}

ContamResult contam_corr(const std::vector<SlitCutout> &slits,
                         ContamInputs inputs, const config::Config &cfg,
                         const core::Diagnostics &diag) {
  try {
    cfg.validate();
  } catch (const ValidationError &e) {
    throw ConfigError(e.what());
  }

  const int rows = cfg.frame.height;
  const int cols = cfg.frame.width;

  ContamResult result;
  result.corrected = slits;

  if (!cfg.contam.enabled || slits.empty()) {
    result.simulated = Matrix2Df::Zero(rows, cols);
    result.status = CalStepStatus::SKIPPED;
    diag.warning(slits.empty() ? "no slits to correct, step skipped"
                               : "contamination correction disabled, step skipped");
    return result;
  }

  const MaxCores max_cores = string_to_max_cores(cfg.contam.max_cores);
  result.workers =
      core::resolve_worker_count(max_cores, core::available_cores());

  const PlacementMode placement =
      string_to_placement_mode(cfg.contam.placement);

  // Everything that can be rejected is rejected before dispersing
  const std::map<int, dispersion::OrderSetup> setups =
      resolve_order_setups(inputs.tables, cfg.instrument);
  for (const auto &kv : setups) {
    result.orders.push_back(kv.first);
  }
  for (const auto &slit : slits) {
    check_window(slit.window(), rows, cols);
    if (setups.find(slit.spectral_order()) == setups.end()) {
      throw LookupError("slit '" + slit.meta().name + "': order " +
                        std::to_string(slit.spectral_order()) +
                        " not in wavelength range table");
    }
  }
  const dispersion::OffsetTable offsets =
      placement_offsets(placement, slits, inputs.segment_offsets);

  dispersion::DispersionOptions options;
  options.oversample = cfg.contam.oversample;
  options.min_samples = cfg.contam.min_samples;
  options.max_samples = cfg.contam.max_samples;

  dispersion::Observation obs(std::move(inputs.sources), rows, cols,
                              inputs.transform, result.workers, options);

  Matrix2Dd composite = Matrix2Dd::Zero(rows, cols);
  int done = 0;
  for (const auto &kv : setups) {
    obs.disperse_all(kv.second, offsets, diag);
    composite += obs.simulated_image();
    ++done;
    diag.progress(Phase::CONTAMINATION,
                  static_cast<float>(done) / static_cast<float>(setups.size()),
                  "simulated order " + std::to_string(kv.first));
  }

  result.contamination.reserve(slits.size());
  const int total = static_cast<int>(slits.size());
  for (int i = 0; i < total; ++i) {
    const SlitCutout &slit = slits[static_cast<size_t>(i)];
    const int sid = slit.source_id();

    const dispersion::ChunkResult chunk = obs.disperse_chunk(
        sid, setups.at(slit.spectral_order()),
        dispersion::lookup_offset(offsets, sid), diag);

    Matrix2Df cutout = contamination_cutout(composite, chunk.image, slit.window());
    subtract_contamination(result.corrected[static_cast<size_t>(i)], cutout);
    result.contamination.push_back(copy_slit_info(slit, std::move(cutout)));

    diag.source_processed(Phase::CONTAMINATION, sid, i, total);
  }

  result.simulated = composite.cast<float>();
  result.status = CalStepStatus::COMPLETE;
  return result;
}

} // namespace wfss_contam::contam
