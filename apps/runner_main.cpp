#include "runner_pipeline.hpp"

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

namespace {

void print_usage() {
  std::cout << "Usage: wfss_contam_runner <command> [options]\n\n"
            << "Commands:\n"
            << "  run      Run the contamination correction\n"
            << "  info     Print the resolved configuration\n"
            << "\nOptions:\n"
            << "  --config <path>        Path to config.yaml\n"
            << "  --reference <path>     Reference tables YAML (run)\n"
            << "  --direct <path>        Direct image FITS (run)\n"
            << "  --segmentation <path>  Segmentation map FITS (run)\n"
            << "  --slits <path>         Multi-slit FITS (run)\n"
            << "  --runs-dir <path>      Directory for run outputs (run)\n"
            << "  --dry-run              Dry run (no actual processing)\n"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"WFSS contamination correction runner"};

  RunArgs run_args;
  std::string info_config;

  auto run_cmd = app.add_subcommand("run", "Run the contamination correction");
  run_cmd->add_option("--config", run_args.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--reference", run_args.reference_path,
                      "Reference tables YAML")
      ->required();
  run_cmd->add_option("--direct", run_args.direct_path, "Direct image FITS")
      ->required();
  run_cmd->add_option("--segmentation", run_args.segmentation_path,
                      "Segmentation map FITS")
      ->required();
  run_cmd->add_option("--slits", run_args.slits_path, "Multi-slit FITS")
      ->required();
  run_cmd->add_option("--runs-dir", run_args.runs_dir, "Runs directory")
      ->required();
  run_cmd->add_flag("--dry-run", run_args.dry_run, "Dry run");

  auto info_cmd = app.add_subcommand("info", "Print the resolved configuration");
  info_cmd->add_option("--config", info_config, "Path to config.yaml")
      ->required();

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_pipeline_command(run_args);
  }

  if (info_cmd->parsed()) {
    return info_command(info_config);
  }

  print_usage();
  return 1;
}
