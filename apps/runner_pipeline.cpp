#include "runner_pipeline.hpp"

#include "wfss_contam/config/configuration.hpp"
#include "wfss_contam/contam/contam_corr.hpp"
#include "wfss_contam/core/events.hpp"
#include "wfss_contam/core/types.hpp"
#include "wfss_contam/core/utils.hpp"
#include "wfss_contam/dispersion/source.hpp"
#include "wfss_contam/io/fits_io.hpp"
#include "wfss_contam/io/reference_io.hpp"
#include "wfss_contam/reference/tables.hpp"

#include "runner_shared.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

using wfss_contam::Matrix2Df;
using wfss_contam::Matrix2Di;
using wfss_contam::Phase;

namespace core = wfss_contam::core;
namespace config = wfss_contam::config;
namespace contam = wfss_contam::contam;
namespace dispersion = wfss_contam::dispersion;
namespace io = wfss_contam::io;
namespace reference = wfss_contam::reference;
using wfss_contam::runner::TeeBuf;
using wfss_contam::runner::fail_phase;

bool require_file(const std::string &path, const std::string &what) {
  if (path.empty() || !fs::exists(path)) {
    std::cerr << "Error: " << what << " not found: " << path << std::endl;
    return false;
  }
  return true;
}

} // namespace

int run_pipeline_command(const RunArgs &args) {
  if (!require_file(args.config_path, "Config file") ||
      !require_file(args.reference_path, "Reference file") ||
      !require_file(args.direct_path, "Direct image") ||
      !require_file(args.segmentation_path, "Segmentation map") ||
      !require_file(args.slits_path, "Slit file")) {
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(args.config_path);
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::string run_id = core::get_run_id();
  fs::path run_dir = fs::path(args.runs_dir) / run_id;
  fs::path out_dir = run_dir / cfg.output.outputs_dir;
  fs::create_directories(run_dir / "logs");
  fs::create_directories(out_dir);

  core::copy_config(args.config_path, run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  core::Diagnostics diag(emitter, run_id, log_file);

  emitter.run_start(run_id,
                    {{"config_path", args.config_path},
                     {"config_sha256", core::sha256_file(args.config_path)},
                     {"reference_path", args.reference_path},
                     {"direct_path", args.direct_path},
                     {"segmentation_path", args.segmentation_path},
                     {"slits_path", args.slits_path},
                     {"run_dir", run_dir.string()},
                     {"dry_run", args.dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  if (args.dry_run) {
    emitter.phase_start(run_id, Phase::LOAD_INPUT, "LOAD_INPUT", log_file);
    emitter.phase_end(run_id, Phase::LOAD_INPUT, "skipped",
                      {{"reason", "dry_run"}}, log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  // Phase 0: LOAD_INPUT
  emitter.phase_start(run_id, Phase::LOAD_INPUT, "LOAD_INPUT", log_file);
  std::cout << "[PHASE] LOAD_INPUT" << std::endl;

  io::ReferenceBundle ref;
  Matrix2Df direct;
  Matrix2Di segmentation;
  std::vector<contam::SlitCutout> slits;
  io::FitsHeader slit_primary;
  try {
    ref = io::load_reference(args.reference_path);
    direct = io::read_fits_float(args.direct_path).first;
    segmentation = io::read_fits_int(args.segmentation_path);
    std::tie(slits, slit_primary) = io::read_slits(args.slits_path, ref.transform);
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::LOAD_INPUT, e.what(), log_file);
  }

  if (direct.rows() != cfg.frame.height || direct.cols() != cfg.frame.width) {
    emitter.warning(run_id,
                    "Direct image is " + std::to_string(direct.cols()) + "x" +
                        std::to_string(direct.rows()) + ", frame is " +
                        std::to_string(cfg.frame.width) + "x" +
                        std::to_string(cfg.frame.height),
                    log_file);
  }
  if (auto instrument = slit_primary.get_string("INSTRUME")) {
    if (core::to_upper(*instrument) != core::to_upper(cfg.instrument.name)) {
      emitter.warning(run_id,
                      "Slit file INSTRUME '" + *instrument +
                          "' differs from instrument.name '" +
                          cfg.instrument.name + "'",
                      log_file);
    }
  }

  emitter.phase_end(run_id, Phase::LOAD_INPUT, "ok",
                    {{"slits", slits.size()},
                     {"direct_rows", direct.rows()},
                     {"direct_cols", direct.cols()},
                     {"wavelength_ranges", ref.tables.wavelength_ranges.size()},
                     {"sensitivity_curves", ref.tables.sensitivity.size()}},
                    log_file);

  // Phase 1: SETUP_ORDERS
  emitter.phase_start(run_id, Phase::SETUP_ORDERS, "SETUP_ORDERS", log_file);
  std::cout << "[PHASE] SETUP_ORDERS" << std::endl;

  contam::ContamInputs inputs;
  std::vector<int> orders;
  try {
    orders = ref.tables.wavelength_ranges.orders();
    auto segments = dispersion::build_sources(direct, segmentation, orders);
    inputs.segment_offsets = dispersion::offsets_from_segments(segments);
    inputs.sources.reserve(segments.size());
    for (auto &s : segments) {
      inputs.sources.push_back(std::move(s.source));
    }
    inputs.transform = ref.transform;
    inputs.tables = ref.tables;
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::SETUP_ORDERS, e.what(), log_file);
  }

  const std::string filter_name = reference::resolve_filter_name(
      cfg.instrument.name, cfg.instrument.filter, cfg.instrument.pupil);
  emitter.phase_end(run_id, Phase::SETUP_ORDERS, "ok",
                    {{"orders", orders},
                     {"filter_name", filter_name},
                     {"sources", inputs.sources.size()}},
                    log_file);

  // Phase 2: CONTAMINATION
  emitter.phase_start(run_id, Phase::CONTAMINATION, "CONTAMINATION", log_file);
  std::cout << "[PHASE] CONTAMINATION" << std::endl;

  contam::ContamResult result;
  try {
    result = contam::contam_corr(slits, std::move(inputs), cfg, diag);
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::CONTAMINATION, e.what(), log_file);
  }

  const std::string status = wfss_contam::cal_step_status_to_string(result.status);
  emitter.phase_end(run_id, Phase::CONTAMINATION,
                    result.status == wfss_contam::CalStepStatus::COMPLETE ? "ok"
                                                                          : "skipped",
                    {{"cal_step_status", status},
                     {"workers", result.workers},
                     {"orders", result.orders},
                     {"contamination_slits", result.contamination.size()}},
                    log_file);

  // Phase 3: WRITE_OUTPUT
  emitter.phase_start(run_id, Phase::WRITE_OUTPUT, "WRITE_OUTPUT", log_file);
  std::cout << "[PHASE] WRITE_OUTPUT" << std::endl;

  std::vector<std::string> written;
  try {
    io::FitsHeader primary = slit_primary;
    primary.set("S_WCONTM", status);

    io::write_slits(out_dir / "corrected.fits", result.corrected, primary);
    written.push_back("corrected.fits");

    if (cfg.output.write_simulated) {
      io::FitsHeader sim_header;
      sim_header.set("S_WCONTM", status);
      sim_header.set("FILTER", cfg.instrument.filter);
      sim_header.set("PUPIL", cfg.instrument.pupil);
      io::write_fits_float(out_dir / "simulated.fits", result.simulated, sim_header);
      written.push_back("simulated.fits");
    }
    if (cfg.output.write_contam && !result.contamination.empty()) {
      io::write_slits(out_dir / "contam.fits", result.contamination, primary);
      written.push_back("contam.fits");
    }

    core::json per_slit = core::json::array();
    for (const auto &c : result.contamination) {
      per_slit.push_back(
          {{"name", c.meta().name},
           {"source_id", c.meta().source_id},
           {"order", c.meta().spectral_order},
           {"contamination_flux", core::sum_finite(c.data().cast<double>())}});
    }
    core::json summary = {{"run_id", run_id},
                          {"cal_step_status", status},
                          {"workers", result.workers},
                          {"orders", result.orders},
                          {"simulated_flux",
                           core::sum_finite(result.simulated.cast<double>())},
                          {"slits", per_slit}};
    fs::create_directories(run_dir / "artifacts");
    core::write_text(run_dir / "artifacts" / "contam_summary.json",
                     summary.dump(2));
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::WRITE_OUTPUT, e.what(), log_file);
  }

  emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok",
                    {{"outputs", written}, {"outputs_dir", out_dir.string()}},
                    log_file);

  emitter.run_end(run_id, true, "ok", log_file);
  std::cout << "Done: " << status << " (" << core::join(written, ", ") << ")"
            << std::endl;
  return 0;
}

int info_command(const std::string &config_path) {
  config::Config cfg;
  try {
    cfg = config::Config::load(config_path);
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const int cores = core::available_cores();
  core::json info = {
      {"config_path", config_path},
      {"frame", {{"width", cfg.frame.width}, {"height", cfg.frame.height}}},
      {"instrument", cfg.instrument.name},
      {"filter_name", reference::resolve_filter_name(cfg.instrument.name,
                                                     cfg.instrument.filter,
                                                     cfg.instrument.pupil)},
      {"enabled", cfg.contam.enabled},
      {"placement", wfss_contam::placement_mode_to_string(
                        wfss_contam::string_to_placement_mode(cfg.contam.placement))},
      {"max_cores", wfss_contam::max_cores_to_string(
                        wfss_contam::string_to_max_cores(cfg.contam.max_cores))},
      {"available_cores", cores},
      {"workers", core::resolve_worker_count(
                      wfss_contam::string_to_max_cores(cfg.contam.max_cores),
                      cores)}};
  std::cout << info.dump(2) << std::endl;
  return 0;
}
