#include "wfss_contam/core/events.hpp"
#include "wfss_contam/core/utils.hpp"

#include <utility>

namespace wfss_contam::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& name, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = name;
    emit(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, float progress,
                                  const std::string& message, std::ostream& out) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = static_cast<int>(progress * 100);
    event["total"] = 100;
    event["progress"] = progress;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::source_processed(const std::string& run_id, Phase phase, int source_id,
                                    int index, int total, std::ostream& out) {
    json event = base_event("source_processed", run_id);
    event["phase"] = phase_to_int(phase);
    event["source_id"] = source_id;
    event["index"] = index;
    event["total"] = total;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

Diagnostics::Diagnostics(EventEmitter& emitter, std::string run_id, std::ostream& out)
    : emitter_(&emitter), run_id_(std::move(run_id)), out_(&out) {}

void Diagnostics::progress(Phase phase, float progress, const std::string& message) const {
    if (!enabled()) return;
    emitter_->phase_progress(run_id_, phase, progress, message, *out_);
}

void Diagnostics::source_processed(Phase phase, int source_id, int index, int total) const {
    if (!enabled()) return;
    emitter_->source_processed(run_id_, phase, source_id, index, total, *out_);
}

void Diagnostics::warning(const std::string& message) const {
    if (!enabled()) return;
    emitter_->warning(run_id_, message, *out_);
}

void Diagnostics::event(const std::string& type, const json& data) const {
    if (!enabled()) return;
    emit_event(type, run_id_, data, *out_);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace wfss_contam::core
