#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace wfss_contam::config {

namespace fs = std::filesystem;

struct FrameConfig {
  int width = 2048;
  int height = 2048;
};

struct InstrumentConfig {
  std::string name = "NIRCAM";  // NIRCAM | NIRISS
  std::string filter;
  std::string pupil;
};

struct ContamConfig {
  bool enabled = true;
  std::string max_cores = "none";        // none | quarter | half | all
  // segmentation: sources sit at their direct-image segment origin, the frame
  // the trace polynomials are fitted in. slit: every source needs a slit and
  // sits at its window origin.
  std::string placement = "segmentation"; // segmentation | slit
  double oversample = 2.0;  // wavelength samples per pixel of trace
  int min_samples = 16;
  int max_samples = 4096;
};

struct OutputConfig {
  std::string outputs_dir = "outputs";
  bool write_simulated = true;
  bool write_contam = true;
};

struct Config {
  FrameConfig frame;
  InstrumentConfig instrument;
  ContamConfig contam;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace wfss_contam::config
