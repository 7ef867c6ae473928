#pragma once

#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/grism_transform.hpp"
#include "wfss_contam/dispersion/source.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wfss_contam::contam {

// Cutout rectangle in 0-based detector pixels
struct SlitWindow {
  int xstart = 0;
  int ystart = 0;
  int xsize = 0;
  int ysize = 0;
};

struct SlitMeta {
  std::string name;
  int source_id = 0;
  std::string source_type = "UNKNOWN";
  double source_xpos = 0.0;
  double source_ypos = 0.0;
  int spectral_order = 1;
  int dispersion_direction = 1;
  std::shared_ptr<const dispersion::GrismTransform> wcs;
};

// 2D spectral cutout of one source in one order. The data shape always
// equals (ysize, xsize) of the window.
class SlitCutout {
public:
  SlitCutout(SlitWindow window, Matrix2Df data, SlitMeta meta);

  const SlitWindow &window() const { return window_; }
  const Matrix2Df &data() const { return data_; }
  const SlitMeta &meta() const { return meta_; }

  int source_id() const { return meta_.source_id; }
  int spectral_order() const { return meta_.spectral_order; }

  // data -= cutout; throws ValidationError on a shape mismatch
  void subtract(const Matrix2Df &cutout);

private:
  SlitWindow window_;
  Matrix2Df data_;
  SlitMeta meta_;
};

// New slit with the window and metadata of `src` and the given pixels.
SlitCutout copy_slit_info(const SlitCutout &src, Matrix2Df data);

// Throws BoundsError unless the window lies inside a rows x cols frame.
// A window ending exactly on the last row/column is inside.
void check_window(const SlitWindow &window, int rows, int cols);

// Placement from the slits' (xstart, ystart). A source with several slits
// takes the origin of its last slit.
dispersion::OffsetTable offsets_from_slits(const std::vector<SlitCutout> &slits);

} // namespace wfss_contam::contam
