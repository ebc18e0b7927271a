#include "shoreline/core/events.hpp"
#include "shoreline/core/utils.hpp"

namespace shoreline::core {

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

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
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

void EventEmitter::artifact_written(const std::string& run_id, Phase phase,
                                    const std::string& kind, const std::string& path,
                                    std::ostream& out) {
    json event = base_event("artifact_written", run_id);
    event["phase"] = phase_to_int(phase);
    event["kind"] = kind;
    event["path"] = path;
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

} // namespace shoreline::core
