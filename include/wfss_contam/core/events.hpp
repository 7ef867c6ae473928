#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace wfss_contam::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& name, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, float progress,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void source_processed(const std::string& run_id, Phase phase, int source_id,
                          int index, int total, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

// Event sink handed to the engine. A default-constructed value drops
// every event, so library callers (and tests) need no stream.
class Diagnostics {
public:
    Diagnostics() = default;
    Diagnostics(EventEmitter& emitter, std::string run_id, std::ostream& out);

    bool enabled() const { return emitter_ != nullptr && out_ != nullptr; }
    const std::string& run_id() const { return run_id_; }

    void progress(Phase phase, float progress, const std::string& message) const;
    void source_processed(Phase phase, int source_id, int index, int total) const;
    void warning(const std::string& message) const;
    void event(const std::string& type, const json& data) const;

private:
    EventEmitter* emitter_ = nullptr;
    std::string run_id_;
    std::ostream* out_ = nullptr;
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace wfss_contam::core
