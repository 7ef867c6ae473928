#include "wfss_contam/reference/tables.hpp"
#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace wfss_contam::reference {

namespace core = wfss_contam::core;

void WavelengthRangeTable::add(const std::string &filter, int order,
                               double wmin, double wmax) {
  if (!std::isfinite(wmin) || !std::isfinite(wmax) || !(wmin < wmax)) {
    throw ValidationError("wavelength range for " + filter + " order " +
                          std::to_string(order) + " must satisfy wmin < wmax");
  }
  ranges_[{core::to_upper(filter), order}] = {order, wmin, wmax};
}

SpectralOrderRange WavelengthRangeTable::get(const std::string &filter,
                                             int order) const {
  auto it = ranges_.find({core::to_upper(filter), order});
  if (it == ranges_.end()) {
    throw LookupError("no wavelength range for filter " + filter + " order " +
                      std::to_string(order));
  }
  return it->second;
}

bool WavelengthRangeTable::contains(const std::string &filter,
                                    int order) const {
  return ranges_.count({core::to_upper(filter), order}) > 0;
}

std::vector<int> WavelengthRangeTable::orders() const {
  std::set<int> unique;
  for (const auto &[key, range] : ranges_) {
    if (key.second != 0) {
      unique.insert(key.second);
    }
  }
  return std::vector<int>(unique.begin(), unique.end());
}

SensitivityCurve::SensitivityCurve(std::vector<double> wavelengths,
                                   std::vector<double> response)
    : wavelengths_(std::move(wavelengths)), response_(std::move(response)) {
  if (wavelengths_.size() != response_.size()) {
    throw ValidationError("sensitivity wavelengths and response differ in length");
  }
  if (wavelengths_.size() < 2) {
    throw ValidationError("sensitivity curve needs at least two samples");
  }
  for (size_t i = 0; i < wavelengths_.size(); ++i) {
    if (!std::isfinite(wavelengths_[i]) || !std::isfinite(response_[i])) {
      throw ValidationError("sensitivity curve contains non-finite samples");
    }
    if (i > 0 && !(wavelengths_[i] > wavelengths_[i - 1])) {
      throw ValidationError("sensitivity wavelengths must be strictly increasing");
    }
  }
}

SensitivityCurve SensitivityCurve::flat(double wmin, double wmax,
                                        double value) {
  return SensitivityCurve({wmin, wmax}, {value, value});
}

bool SensitivityCurve::contains(double wavelength) const {
  if (wavelengths_.empty() || !std::isfinite(wavelength)) return false;
  return wavelength >= wavelengths_.front() && wavelength <= wavelengths_.back();
}

double SensitivityCurve::response_at(double wavelength) const {
  if (!contains(wavelength)) return 0.0;

  const auto it =
      std::lower_bound(wavelengths_.begin(), wavelengths_.end(), wavelength);
  const size_t hi = static_cast<size_t>(it - wavelengths_.begin());
  if (hi == 0) return response_.front();
  if (wavelengths_[hi] == wavelength) return response_[hi];

  const size_t lo = hi - 1;
  const double w =
      (wavelength - wavelengths_[lo]) / (wavelengths_[hi] - wavelengths_[lo]);
  return response_[lo] * (1.0 - w) + response_[hi] * w;
}

double SensitivityCurve::min_wavelength() const {
  return wavelengths_.empty() ? 0.0 : wavelengths_.front();
}

double SensitivityCurve::max_wavelength() const {
  return wavelengths_.empty() ? 0.0 : wavelengths_.back();
}

void SensitivityTable::add(const std::string &filter, const std::string &pupil,
                           int order, SensitivityCurve curve) {
  if (curve.empty()) {
    throw ValidationError("empty sensitivity curve for " + filter + "/" +
                          pupil + " order " + std::to_string(order));
  }
  curves_[{core::to_upper(filter), core::to_upper(pupil), order}] =
      std::move(curve);
}

const SensitivityCurve &SensitivityTable::get(const std::string &filter,
                                              const std::string &pupil,
                                              int order) const {
  auto it =
      curves_.find({core::to_upper(filter), core::to_upper(pupil), order});
  if (it == curves_.end()) {
    throw LookupError("no sensitivity curve for " + filter + "/" + pupil +
                      " order " + std::to_string(order));
  }
  return it->second;
}

bool SensitivityTable::contains(const std::string &filter,
                                const std::string &pupil, int order) const {
  return curves_.count(
             {core::to_upper(filter), core::to_upper(pupil), order}) > 0;
}

std::string resolve_filter_name(const std::string &instrument,
                                const std::string &filter,
                                const std::string &pupil) {
  if (core::to_upper(instrument) == "NIRISS") {
    return pupil;
  }
  return filter;
}

} // namespace wfss_contam::reference
