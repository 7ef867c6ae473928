#include "runner_shared.hpp"

#include <iostream>

namespace wfss_contam::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

int fail_phase(core::EventEmitter &emitter, const std::string &run_id,
               Phase phase, const std::string &message, std::ostream &log) {
  emitter.error(run_id, message, log);
  emitter.phase_end(run_id, phase, "error", {{"error", message}}, log);
  emitter.run_end(run_id, false, "error", log);
  std::cerr << "Error during " << phase_to_string(phase) << ": " << message
            << std::endl;
  return 1;
}

} // namespace wfss_contam::runner
