#include "wfss_contam/dispersion/grism_transform.hpp"
#include "wfss_contam/core/errors.hpp"

#include <utility>

namespace wfss_contam::dispersion {

static double eval_poly(const std::vector<double> &coeffs, double t) {
  double acc = 0.0;
  for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
    acc = acc * t + *it;
  }
  return acc;
}

static bool all_finite(const std::vector<double> &v) {
  for (double c : v) {
    if (!std::isfinite(c)) return false;
  }
  return true;
}

PolynomialGrismTransform::PolynomialGrismTransform(
    std::vector<TraceCoefficients> traces) {
  for (auto &t : traces) {
    add_trace(std::move(t));
  }
}

void PolynomialGrismTransform::add_trace(TraceCoefficients trace) {
  if (trace.dx.empty() || trace.dy.empty()) {
    throw ValidationError("trace for order " + std::to_string(trace.order) +
                          " needs dx and dy coefficients");
  }
  if (!std::isfinite(trace.wavelength_ref) || !all_finite(trace.dx) ||
      !all_finite(trace.dy)) {
    throw ValidationError("trace for order " + std::to_string(trace.order) +
                          " has non-finite coefficients");
  }
  const int order = trace.order;
  traces_[order] = std::move(trace);
}

const TraceCoefficients &PolynomialGrismTransform::trace(int order) const {
  auto it = traces_.find(order);
  if (it == traces_.end()) {
    throw LookupError("no grism trace for order " + std::to_string(order));
  }
  return it->second;
}

std::vector<int> PolynomialGrismTransform::orders() const {
  std::vector<int> out;
  out.reserve(traces_.size());
  for (const auto &[order, t] : traces_) {
    out.push_back(order);
  }
  return out;
}

DetectorPosition PolynomialGrismTransform::to_detector(double x, double y,
                                                       double wavelength,
                                                       int order) const {
  const TraceCoefficients &t = trace(order);
  const double dl = wavelength - t.wavelength_ref;
  return {x + eval_poly(t.dx, dl), y + eval_poly(t.dy, dl)};
}

bool PolynomialGrismTransform::has_order(int order) const {
  return traces_.count(order) > 0;
}

} // namespace wfss_contam::dispersion
