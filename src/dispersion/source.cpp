#include "wfss_contam/dispersion/source.hpp"
#include "wfss_contam/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <opencv2/opencv.hpp>

namespace wfss_contam::dispersion {

const PixelOffset &lookup_offset(const OffsetTable &offsets, int source_id) {
  auto it = offsets.find(source_id);
  if (it == offsets.end()) {
    throw LookupError("no placement offset for source " +
                      std::to_string(source_id));
  }
  return it->second;
}

Source::Source(int id, Matrix2Df flux, std::vector<int> orders)
    : id_(id), flux_(std::move(flux)), orders_(std::move(orders)) {
  if (flux_.size() == 0) {
    throw ValidationError("source " + std::to_string(id_) +
                          " has an empty flux template");
  }
  if (!flux_.allFinite()) {
    throw ValidationError("source " + std::to_string(id_) +
                          " has non-finite template values");
  }
  std::sort(orders_.begin(), orders_.end());
  orders_.erase(std::unique(orders_.begin(), orders_.end()), orders_.end());
}

bool Source::has_order(int order) const {
  return std::binary_search(orders_.begin(), orders_.end(), order);
}

double Source::total_flux() const {
  double total = 0.0;
  for (Eigen::Index i = 0; i < flux_.size(); ++i) {
    const float v = flux_.data()[i];
    if (v > 0.0f) total += static_cast<double>(v);
  }
  return total;
}

int Source::negative_pixels() const {
  int n = 0;
  for (Eigen::Index i = 0; i < flux_.size(); ++i) {
    if (flux_.data()[i] < 0.0f) ++n;
  }
  return n;
}

std::vector<SegmentedSource> build_sources(const Matrix2Df &direct,
                                           const Matrix2Di &segmentation,
                                           const std::vector<int> &orders) {
  if (direct.rows() != segmentation.rows() ||
      direct.cols() != segmentation.cols()) {
    throw ValidationError("direct image and segmentation map differ in shape");
  }

  // Bounding box per segment id, single pass
  std::map<int, cv::Rect> boxes;
  for (int y = 0; y < segmentation.rows(); ++y) {
    for (int x = 0; x < segmentation.cols(); ++x) {
      const int id = segmentation(y, x);
      if (id <= 0) continue;
      const cv::Rect px(x, y, 1, 1);
      auto it = boxes.find(id);
      if (it == boxes.end()) {
        boxes.emplace(id, px);
      } else {
        it->second |= px;
      }
    }
  }

  cv::Mat direct_cv(static_cast<int>(direct.rows()),
                    static_cast<int>(direct.cols()), CV_32F,
                    const_cast<float *>(direct.data()));
  cv::Mat seg_cv(static_cast<int>(segmentation.rows()),
                 static_cast<int>(segmentation.cols()), CV_32S,
                 const_cast<int32_t *>(segmentation.data()));

  std::vector<SegmentedSource> out;
  out.reserve(boxes.size());
  for (const auto &[id, rect] : boxes) {
    cv::Mat1b mask;
    cv::compare(seg_cv(rect), cv::Scalar(id), mask, cv::CMP_EQ);

    cv::Mat tmpl = cv::Mat::zeros(rect.size(), CV_32F);
    direct_cv(rect).copyTo(tmpl, mask);

    Matrix2Df flux(rect.height, rect.width);
    for (int r = 0; r < rect.height; ++r) {
      const float *row = tmpl.ptr<float>(r);
      for (int c = 0; c < rect.width; ++c) {
        flux(r, c) = std::isfinite(row[c]) ? row[c] : 0.0f;
      }
    }

    out.push_back({Source(id, std::move(flux), orders), {rect.x, rect.y}});
  }
  return out;
}

OffsetTable offsets_from_segments(const std::vector<SegmentedSource> &segments) {
  OffsetTable offsets;
  for (const auto &s : segments) {
    offsets[s.source.id()] = s.origin;
  }
  return offsets;
}

} // namespace wfss_contam::dispersion
