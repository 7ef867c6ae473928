#pragma once

#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace wfss_contam::reference {

// Dispersion extent of one spectral order
struct SpectralOrderRange {
  int order = 0;
  double wmin = 0.0;
  double wmax = 0.0;
};

// (filter, order) -> wavelength range. Filter names are matched
// case-insensitively.
class WavelengthRangeTable {
public:
  void add(const std::string &filter, int order, double wmin, double wmax);

  SpectralOrderRange get(const std::string &filter, int order) const;
  bool contains(const std::string &filter, int order) const;

  // Distinct non-zero orders over all filters, ascending.
  std::vector<int> orders() const;

  bool empty() const { return ranges_.empty(); }
  size_t size() const { return ranges_.size(); }

private:
  std::map<std::pair<std::string, int>, SpectralOrderRange> ranges_;
};

// Sampled sensitivity (inverse flux calibration) of one order.
// Linear interpolation inside the sampled domain, zero outside it.
class SensitivityCurve {
public:
  SensitivityCurve() = default;
  SensitivityCurve(std::vector<double> wavelengths,
                   std::vector<double> response);

  static SensitivityCurve flat(double wmin, double wmax, double value);

  double response_at(double wavelength) const;
  bool contains(double wavelength) const;

  double min_wavelength() const;
  double max_wavelength() const;

  const std::vector<double> &wavelengths() const { return wavelengths_; }
  const std::vector<double> &response() const { return response_; }
  bool empty() const { return wavelengths_.empty(); }

private:
  std::vector<double> wavelengths_;
  std::vector<double> response_;
};

// (filter, pupil, order) -> sensitivity curve
class SensitivityTable {
public:
  void add(const std::string &filter, const std::string &pupil, int order,
           SensitivityCurve curve);

  const SensitivityCurve &get(const std::string &filter,
                              const std::string &pupil, int order) const;
  bool contains(const std::string &filter, const std::string &pupil,
                int order) const;

  size_t size() const { return curves_.size(); }

private:
  std::map<std::tuple<std::string, std::string, int>, SensitivityCurve>
      curves_;
};

struct ReferenceTables {
  WavelengthRangeTable wavelength_ranges;
  SensitivityTable sensitivity;
};

// NIRISS carries its blocking filters in the PUPIL wheel and its grisms in
// the FILTER wheel; every other instrument is the other way round.
std::string resolve_filter_name(const std::string &instrument,
                                const std::string &filter,
                                const std::string &pupil);

} // namespace wfss_contam::reference
