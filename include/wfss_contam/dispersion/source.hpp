#pragma once

#include "wfss_contam/core/types.hpp"

#include <map>
#include <vector>

namespace wfss_contam::dispersion {

// Detector position of a template's (0,0) pixel
struct PixelOffset {
  int x = 0;
  int y = 0;
};

using OffsetTable = std::map<int, PixelOffset>;

// Throws LookupError when `source_id` has no placement.
const PixelOffset &lookup_offset(const OffsetTable &offsets, int source_id);

// One dispersing source: id, direct-image flux template and the spectral
// orders it is simulated in. Immutable after construction.
class Source {
public:
  Source(int id, Matrix2Df flux, std::vector<int> orders);

  int id() const { return id_; }
  const Matrix2Df &flux() const { return flux_; }
  const std::vector<int> &orders() const { return orders_; }
  bool has_order(int order) const;

  // Sum of the positive template values
  double total_flux() const;
  int negative_pixels() const;

private:
  int id_;
  Matrix2Df flux_;
  std::vector<int> orders_;
};

struct SegmentedSource {
  Source source;
  PixelOffset origin;  // bounding-box corner in the direct image
};

// One source per positive segment id, ascending by id. The template is the
// direct image inside the segment's bounding box, zero outside the segment
// and wherever the direct image is not finite.
std::vector<SegmentedSource> build_sources(const Matrix2Df &direct,
                                           const Matrix2Di &segmentation,
                                           const std::vector<int> &orders);

OffsetTable offsets_from_segments(const std::vector<SegmentedSource> &segments);

} // namespace wfss_contam::dispersion
