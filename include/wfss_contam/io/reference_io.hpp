#pragma once

#include "wfss_contam/core/types.hpp"
#include "wfss_contam/dispersion/grism_transform.hpp"
#include "wfss_contam/reference/tables.hpp"

#include <memory>
#include <yaml-cpp/yaml.h>

namespace wfss_contam::io {

// In-memory reference data for one exposure:
//
//   wavelength_range:
//     - {filter: F444W, order: 1, wmin: 3.8, wmax: 5.1}
//   sensitivity:
//     - {filter: F444W, pupil: GRISMR, order: 1,
//        wavelength: [...], response: [...]}
//   trace:
//     - {order: 1, wavelength_ref: 4.4, dx: [...], dy: [...]}
struct ReferenceBundle {
    reference::ReferenceTables tables;
    std::shared_ptr<const dispersion::PolynomialGrismTransform> transform;
};

ReferenceBundle load_reference(const fs::path& path);
ReferenceBundle reference_from_yaml(const YAML::Node& node);

} // namespace wfss_contam::io
