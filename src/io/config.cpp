#include "wfss_contam/config/configuration.hpp"
#include "wfss_contam/core/errors.hpp"
#include "wfss_contam/core/types.hpp"

#include <fstream>

namespace wfss_contam::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node = YAML::LoadFile(path.string());
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["frame"]) {
        auto f = node["frame"];
        if (f["width"]) cfg.frame.width = f["width"].as<int>();
        if (f["height"]) cfg.frame.height = f["height"].as<int>();
    }

    if (node["instrument"]) {
        auto i = node["instrument"];
        if (i["name"]) cfg.instrument.name = i["name"].as<std::string>();
        if (i["filter"]) cfg.instrument.filter = i["filter"].as<std::string>();
        if (i["pupil"]) cfg.instrument.pupil = i["pupil"].as<std::string>();
    }

    if (node["contam"]) {
        auto c = node["contam"];
        if (c["enabled"]) cfg.contam.enabled = c["enabled"].as<bool>();
        if (c["max_cores"]) cfg.contam.max_cores = c["max_cores"].as<std::string>();
        if (c["placement"]) cfg.contam.placement = c["placement"].as<std::string>();
        if (c["oversample"]) cfg.contam.oversample = c["oversample"].as<double>();
        if (c["min_samples"]) cfg.contam.min_samples = c["min_samples"].as<int>();
        if (c["max_samples"]) cfg.contam.max_samples = c["max_samples"].as<int>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["outputs_dir"]) cfg.output.outputs_dir = o["outputs_dir"].as<std::string>();
        if (o["write_simulated"]) cfg.output.write_simulated = o["write_simulated"].as<bool>();
        if (o["write_contam"]) cfg.output.write_contam = o["write_contam"].as<bool>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["frame"]["width"] = frame.width;
    node["frame"]["height"] = frame.height;

    node["instrument"]["name"] = instrument.name;
    node["instrument"]["filter"] = instrument.filter;
    node["instrument"]["pupil"] = instrument.pupil;

    node["contam"]["enabled"] = contam.enabled;
    node["contam"]["max_cores"] = contam.max_cores;
    node["contam"]["placement"] = contam.placement;
    node["contam"]["oversample"] = contam.oversample;
    node["contam"]["min_samples"] = contam.min_samples;
    node["contam"]["max_samples"] = contam.max_samples;

    node["output"]["outputs_dir"] = output.outputs_dir;
    node["output"]["write_simulated"] = output.write_simulated;
    node["output"]["write_contam"] = output.write_contam;

    return node;
}

void Config::validate() const {
    if (frame.width < 1 || frame.height < 1) {
        throw ValidationError("frame.width and frame.height must be >= 1");
    }

    if (instrument.filter.empty()) {
        throw ValidationError("instrument.filter must be set");
    }

    if (string_to_max_cores(contam.max_cores) == MaxCores::UNKNOWN) {
        throw ConfigError("contam.max_cores must be one of none|quarter|half|all, got '" +
                          contam.max_cores + "'");
    }
    if (string_to_placement_mode(contam.placement) == PlacementMode::UNKNOWN) {
        throw ConfigError("contam.placement must be 'segmentation' or 'slit', got '" +
                          contam.placement + "'");
    }
    if (!(contam.oversample > 0.0)) {
        throw ValidationError("contam.oversample must be > 0");
    }
    if (contam.min_samples < 2) {
        throw ValidationError("contam.min_samples must be >= 2");
    }
    if (contam.max_samples < contam.min_samples) {
        throw ValidationError("contam.max_samples must be >= contam.min_samples");
    }

    if (output.outputs_dir.empty()) {
        throw ValidationError("output.outputs_dir must not be empty");
    }
}

} // namespace wfss_contam::config
