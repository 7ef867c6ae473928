#pragma once

#include <string>

struct RunArgs {
  std::string config_path;
  std::string reference_path;
  std::string direct_path;
  std::string segmentation_path;
  std::string slits_path;
  std::string runs_dir;
  bool dry_run = false;
};

int run_pipeline_command(const RunArgs &args);

int info_command(const std::string &config_path);
