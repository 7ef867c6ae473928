#pragma once

#include "wfss_contam/config/configuration.hpp"
#include "wfss_contam/contam/slit.hpp"
#include "wfss_contam/core/events.hpp"
#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/disperse.hpp"
#include "wfss_contam/dispersion/grism_transform.hpp"
#include "wfss_contam/dispersion/source.hpp"
#include "wfss_contam/reference/tables.hpp"

#include <map>
#include <memory>
#include <vector>

namespace wfss_contam::contam {

struct ContamInputs {
  std::vector<dispersion::Source> sources;
  // Template origins used with placement "segmentation"
  dispersion::OffsetTable segment_offsets;
  std::shared_ptr<const dispersion::GrismTransform> transform;
  reference::ReferenceTables tables;
};

struct ContamResult {
  std::vector<SlitCutout> corrected;
  Matrix2Df simulated;  // composite over all orders
  std::vector<SlitCutout> contamination;
  CalStepStatus status = CalStepStatus::SKIPPED;
  int workers = 1;
  std::vector<int> orders;
};

// Wavelength range and sensitivity of every non-zero order in the
// wavelength table. ConfigError when there is none, LookupError when an
// order has no entry for the resolved filter.
std::map<int, dispersion::OrderSetup>
resolve_order_setups(const reference::ReferenceTables &tables,
                     const config::InstrumentConfig &instrument);

// SEGMENTATION: segment bounding-box origins (direct-image frame).
// SLIT: slit window origins (grism frame) only; a source without a slit has
// no entry and fails the later lookup with LookupError.
dispersion::OffsetTable placement_offsets(PlacementMode mode,
                                          const std::vector<SlitCutout> &slits,
                                          const dispersion::OffsetTable &segment_offsets);

// (composite - own) inside the window, as float. BoundsError when the
// window leaves the frame.
Matrix2Df contamination_cutout(const Matrix2Dd &composite, const Matrix2Dd &own,
                               const SlitWindow &window);

void subtract_contamination(SlitCutout &slit, const Matrix2Df &cutout);

// Removes the simulated flux of all other sources from every slit. The
// input slits are not modified. Disabled correction or an empty slit list
// returns a copy of the input with status SKIPPED.
ContamResult contam_corr(const std::vector<SlitCutout> &slits,
                         ContamInputs inputs, const config::Config &cfg,
                         const core::Diagnostics &diag = {});

} // namespace wfss_contam::contam
