#include "wfss_contam/contam/slit.hpp"
#include "wfss_contam/core/errors.hpp"

#include <utility>

namespace wfss_contam::contam {

SlitCutout::SlitCutout(SlitWindow window, Matrix2Df data, SlitMeta meta)
    : window_(window), data_(std::move(data)), meta_(std::move(meta)) {
  if (window_.xsize < 1 || window_.ysize < 1) {
    throw ValidationError("slit '" + meta_.name + "': window size must be >= 1");
  }
  if (data_.rows() != window_.ysize || data_.cols() != window_.xsize) {
    throw ValidationError("slit '" + meta_.name + "': data is " +
                          std::to_string(data_.rows()) + "x" +
                          std::to_string(data_.cols()) + ", window is " +
                          std::to_string(window_.ysize) + "x" +
                          std::to_string(window_.xsize));
  }
}

void SlitCutout::subtract(const Matrix2Df &cutout) {
  if (cutout.rows() != data_.rows() || cutout.cols() != data_.cols()) {
    throw ValidationError("slit '" + meta_.name +
                          "': contamination cutout shape mismatch");
  }
  data_ -= cutout;
}

SlitCutout copy_slit_info(const SlitCutout &src, Matrix2Df data) {
  return SlitCutout(src.window(), std::move(data), src.meta());
}

void check_window(const SlitWindow &window, int rows, int cols) {
  const long long x_end =
      static_cast<long long>(window.xstart) + window.xsize;
  const long long y_end =
      static_cast<long long>(window.ystart) + window.ysize;
  if (window.xstart < 0 || window.ystart < 0 || x_end > cols || y_end > rows) {
    throw BoundsError("slit window x=[" + std::to_string(window.xstart) + "," +
                      std::to_string(x_end) + ") y=[" +
                      std::to_string(window.ystart) + "," +
                      std::to_string(y_end) + ") outside " +
                      std::to_string(rows) + "x" + std::to_string(cols) +
                      " frame");
  }
}

dispersion::OffsetTable offsets_from_slits(const std::vector<SlitCutout> &slits) {
  dispersion::OffsetTable offsets;
  for (const auto &slit : slits) {
    offsets[slit.source_id()] =
        dispersion::PixelOffset{slit.window().xstart, slit.window().ystart};
  }
  return offsets;
}

} // namespace wfss_contam::contam
