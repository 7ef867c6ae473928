#include "wfss_contam/io/reference_io.hpp"
#include "wfss_contam/core/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace wfss_contam::io {

namespace {

const YAML::Node require(const YAML::Node& node, const std::string& key,
                         const std::string& where) {
    if (!node[key]) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    return node[key];
}

std::vector<double> as_doubles(const YAML::Node& node, const std::string& where) {
    if (!node.IsSequence()) {
        throw ConfigError(where + ": expected a sequence");
    }
    return node.as<std::vector<double>>();
}

} // namespace

ReferenceBundle load_reference(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Reference file not found: " + path.string());
    }
    try {
        return reference_from_yaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse reference file " + path.string() + ": " + e.what());
    }
}

ReferenceBundle reference_from_yaml(const YAML::Node& node) {
    ReferenceBundle bundle;

    if (const YAML::Node ranges = node["wavelength_range"]) {
        for (const auto& r : ranges) {
            const std::string where = "wavelength_range";
            bundle.tables.wavelength_ranges.add(
                require(r, "filter", where).as<std::string>(),
                require(r, "order", where).as<int>(),
                require(r, "wmin", where).as<double>(),
                require(r, "wmax", where).as<double>());
        }
    }

    if (const YAML::Node curves = node["sensitivity"]) {
        for (const auto& c : curves) {
            const std::string where = "sensitivity";
            std::string pupil = c["pupil"] ? c["pupil"].as<std::string>() : std::string();
            reference::SensitivityCurve curve(
                as_doubles(require(c, "wavelength", where), where + ".wavelength"),
                as_doubles(require(c, "response", where), where + ".response"));
            bundle.tables.sensitivity.add(require(c, "filter", where).as<std::string>(),
                                          pupil,
                                          require(c, "order", where).as<int>(),
                                          std::move(curve));
        }
    }

    auto transform = std::make_shared<dispersion::PolynomialGrismTransform>();
    if (const YAML::Node traces = node["trace"]) {
        for (const auto& t : traces) {
            const std::string where = "trace";
            dispersion::TraceCoefficients coeffs;
            coeffs.order = require(t, "order", where).as<int>();
            coeffs.wavelength_ref = t["wavelength_ref"] ? t["wavelength_ref"].as<double>() : 0.0;
            coeffs.dx = as_doubles(require(t, "dx", where), where + ".dx");
            coeffs.dy = as_doubles(require(t, "dy", where), where + ".dy");
            transform->add_trace(std::move(coeffs));
        }
    }
    bundle.transform = std::move(transform);

    return bundle;
}

} // namespace wfss_contam::io
