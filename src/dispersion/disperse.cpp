#include "wfss_contam/dispersion/disperse.hpp"
#include "wfss_contam/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace wfss_contam::dispersion {

DispersionStats &DispersionStats::operator+=(const DispersionStats &o) {
  elements += o.elements;
  nonfinite_positions += o.nonfinite_positions;
  outside_sensitivity += o.outside_sensitivity;
  negative_pixels += o.negative_pixels;
  input_flux += o.input_flux;
  deposited_flux += o.deposited_flux;
  lost_flux += o.lost_flux;
  return *this;
}

void validate_order_setup(const OrderSetup &setup,
                          const GrismTransform &transform) {
  if (!std::isfinite(setup.wmin) || !std::isfinite(setup.wmax) ||
      !(setup.wmin < setup.wmax)) {
    throw ValidationError("order " + std::to_string(setup.order) +
                          ": wmin must be < wmax");
  }
  if (setup.sensitivity.empty()) {
    throw ValidationError("order " + std::to_string(setup.order) +
                          ": sensitivity curve is empty");
  }
  if (!transform.has_order(setup.order)) {
    throw LookupError("grism transform has no order " +
                      std::to_string(setup.order));
  }
}

int wavelength_sample_count(const Source &source, const OrderSetup &setup,
                            const PixelOffset &offset,
                            const GrismTransform &transform,
                            const DispersionOptions &options) {
  const double cx =
      offset.x + 0.5 * static_cast<double>(source.flux().cols() - 1);
  const double cy =
      offset.y + 0.5 * static_cast<double>(source.flux().rows() - 1);
  const DetectorPosition a =
      transform.to_detector(cx, cy, setup.wmin, setup.order);
  const DetectorPosition b =
      transform.to_detector(cx, cy, setup.wmax, setup.order);

  int n = options.min_samples;
  if (a.finite() && b.finite()) {
    const double length = std::hypot(b.x - a.x, b.y - a.y);
    const double wanted = std::ceil(length * options.oversample);
    if (wanted > static_cast<double>(options.max_samples)) {
      n = options.max_samples;
    } else {
      n = std::max(options.min_samples, static_cast<int>(wanted));
    }
  }
  return std::max(1, n);
}

namespace {

// Adds `flux` spread over the unit square centred on (xg, yg). Pixel i
// covers [i - 0.5, i + 0.5], so the square overlaps pixels floor(xg) and
// floor(xg) + 1 with weights 1 - t and t.
void splat(Matrix2Dd &accum, double xg, double yg, double flux,
           DispersionStats &stats) {
  const double fx0 = std::floor(xg);
  const double fy0 = std::floor(yg);
  const double tx = xg - fx0;
  const double ty = yg - fy0;

  const double wx[2] = {1.0 - tx, tx};
  const double wy[2] = {1.0 - ty, ty};
  const double rows = static_cast<double>(accum.rows());
  const double cols = static_cast<double>(accum.cols());

  for (int j = 0; j < 2; ++j) {
    const double py = fy0 + j;
    for (int i = 0; i < 2; ++i) {
      const double w = wx[i] * wy[j];
      if (w <= 0.0) continue;
      const double px = fx0 + i;
      const double part = flux * w;
      if (px < 0.0 || py < 0.0 || px >= cols || py >= rows) {
        stats.lost_flux += part;
        continue;
      }
      accum(static_cast<Eigen::Index>(py), static_cast<Eigen::Index>(px)) +=
          part;
      stats.deposited_flux += part;
    }
  }
}

} // namespace

DispersionStats disperse_source(const Source &source, const OrderSetup &setup,
                                const PixelOffset &offset,
                                const GrismTransform &transform,
                                Matrix2Dd &accum,
                                const DispersionOptions &options) {
  validate_order_setup(setup, transform);
  if (accum.size() == 0) {
    throw ValidationError("dispersion buffer is empty");
  }

  DispersionStats stats;
  stats.negative_pixels = source.negative_pixels();

  const int n = wavelength_sample_count(source, setup, offset, transform, options);
  const double dw = (setup.wmax - setup.wmin) / static_cast<double>(n);

  std::vector<double> lambdas;
  std::vector<double> weights;
  lambdas.reserve(static_cast<size_t>(n));
  weights.reserve(static_cast<size_t>(n));
  for (int k = 0; k < n; ++k) {
    const double lambda = setup.wmin + (static_cast<double>(k) + 0.5) * dw;
    if (!setup.sensitivity.contains(lambda)) {
      ++stats.outside_sensitivity;
      continue;
    }
    const double sens = setup.sensitivity.response_at(lambda);
    if (sens == 0.0) continue;
    lambdas.push_back(lambda);
    weights.push_back(sens * dw);
  }

  const Matrix2Df &flux = source.flux();
  for (Eigen::Index r = 0; r < flux.rows(); ++r) {
    for (Eigen::Index c = 0; c < flux.cols(); ++c) {
      const double f = static_cast<double>(flux(r, c));
      if (!(f > 0.0)) continue;

      const double x0 = static_cast<double>(offset.x + c);
      const double y0 = static_cast<double>(offset.y + r);
      for (size_t k = 0; k < lambdas.size(); ++k) {
        ++stats.elements;
        const DetectorPosition pos =
            transform.to_detector(x0, y0, lambdas[k], setup.order);
        if (!pos.finite()) {
          ++stats.nonfinite_positions;
          continue;
        }
        const double element = f * weights[k];
        stats.input_flux += element;
        splat(accum, pos.x, pos.y, element, stats);
      }
    }
  }

  return stats;
}

} // namespace wfss_contam::dispersion
