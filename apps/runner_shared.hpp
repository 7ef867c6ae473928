#pragma once

#include "wfss_contam/core/events.hpp"
#include "wfss_contam/core/types.hpp"

#include <ostream>
#include <streambuf>
#include <string>

namespace wfss_contam::runner {

// Writes every character to both buffers (console + run_events.jsonl)
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Closes a failed phase: phase_end "error", run_end, message on stderr.
// Returns the process exit code.
int fail_phase(core::EventEmitter &emitter, const std::string &run_id,
               Phase phase, const std::string &message, std::ostream &log);

} // namespace wfss_contam::runner
