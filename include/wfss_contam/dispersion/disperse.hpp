#pragma once

#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/grism_transform.hpp"
#include "wfss_contam/dispersion/source.hpp"
#include "wfss_contam/reference/tables.hpp"

namespace wfss_contam::dispersion {

// Everything the dispersion of one spectral order needs
struct OrderSetup {
  int order = 1;
  double wmin = 0.0;
  double wmax = 0.0;
  reference::SensitivityCurve sensitivity;
};

struct DispersionOptions {
  double oversample = 2.0;  // wavelength samples per pixel of trace length
  int min_samples = 16;
  int max_samples = 4096;
};

struct DispersionStats {
  long long elements = 0;             // (pixel, wavelength) pairs mapped
  long long nonfinite_positions = 0;  // skipped, transform gave NaN/inf
  long long outside_sensitivity = 0;  // bins with zero response
  long long negative_pixels = 0;      // template values treated as zero
  double input_flux = 0.0;            // flux of all finite elements
  double deposited_flux = 0.0;        // landed inside the frame
  double lost_flux = 0.0;             // fell outside the frame

  DispersionStats &operator+=(const DispersionStats &o);
};

// Number of wavelength bins for one source and order, from the trace
// length of the template centre between wmin and wmax.
int wavelength_sample_count(const Source &source, const OrderSetup &setup,
                            const PixelOffset &offset,
                            const GrismTransform &transform,
                            const DispersionOptions &options);

// Disperses `source` in `setup.order` and adds the result to `accum`, a
// full-frame buffer (rows = y). `accum` is the only thing modified.
//
// Each positive template pixel is sampled at the centre of every wavelength
// bin; the element flux template * sensitivity(lambda) * dlambda is spread
// over the up-to-four detector pixels overlapped by a unit square centred
// on the mapped position (fractional-area splatting). Area outside the frame
// is dropped and reported as lost flux; non-finite positions are skipped.
DispersionStats disperse_source(const Source &source, const OrderSetup &setup,
                                const PixelOffset &offset,
                                const GrismTransform &transform,
                                Matrix2Dd &accum,
                                const DispersionOptions &options = {});

void validate_order_setup(const OrderSetup &setup,
                          const GrismTransform &transform);

} // namespace wfss_contam::dispersion
