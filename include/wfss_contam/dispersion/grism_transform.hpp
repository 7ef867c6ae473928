#pragma once

#include <cmath>
#include <map>
#include <vector>

namespace wfss_contam::dispersion {

struct DetectorPosition {
  double x = 0.0;
  double y = 0.0;

  bool finite() const { return std::isfinite(x) && std::isfinite(y); }
};

// Forward grism transform: direct-image pixel observed at a wavelength in
// a given spectral order -> detector pixel (0-indexed, pixel centres on
// integers). Implementations must be safe to call concurrently.
class GrismTransform {
public:
  virtual ~GrismTransform() = default;

  virtual DetectorPosition to_detector(double x, double y, double wavelength,
                                       int order) const = 0;

  virtual bool has_order(int order) const = 0;
};

// Trace polynomials of one order, evaluated in (lambda - wavelength_ref):
//   xg = x + sum_k dx[k] * t^k
//   yg = y + sum_k dy[k] * t^k
struct TraceCoefficients {
  int order = 1;
  double wavelength_ref = 0.0;
  std::vector<double> dx;
  std::vector<double> dy;
};

// Field-independent polynomial trace per order.
class PolynomialGrismTransform : public GrismTransform {
public:
  PolynomialGrismTransform() = default;
  explicit PolynomialGrismTransform(std::vector<TraceCoefficients> traces);

  void add_trace(TraceCoefficients trace);
  const TraceCoefficients &trace(int order) const;
  std::vector<int> orders() const;

  DetectorPosition to_detector(double x, double y, double wavelength,
                               int order) const override;
  bool has_order(int order) const override;

private:
  std::map<int, TraceCoefficients> traces_;
};

} // namespace wfss_contam::dispersion
