#pragma once

#include <nlohmann/json.hpp>
#include "fleet/core/Dispatcher.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/Registry.hh"
#include "fleet/core/Site.hh"

// ADL-visible to_json for the diagnostic types.
// Enables: nlohmann::json j = event.debug();
//
// Snapshot layout:
//   { "type": "...",
//     "handlers": { "incomplete": [...], "complete": [...], "failed": [...] } }
// with entries { "class", "id", "state", "started", "completed", "message", "success" }.
// Timestamps are seconds since the Unix epoch, null until reached.

namespace fleet {

inline nlohmann::json timestampToJson(const std::optional<Timestamp>& ts) {
    if (!ts) {
        return nullptr;
    }
    return toEpochSeconds(*ts);
}

inline void to_json(nlohmann::json& j, const HandlerDescriptor& d) {
    j = nlohmann::json{{"type", d.type}, {"class", d.className}};
    j["path"] = d.path ? nlohmann::json(*d.path) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json& j, const Site& site) {
    j = nlohmann::json{{"id", site.id}, {"name", site.name}, {"url", site.url}, {"groups", site.groups}};
}

inline void to_json(nlohmann::json& j, const HandlerSnapshot& h) {
    j = nlohmann::json{
        {"class", h.className},
        {"id", h.id},
        {"state", handlerStateToString(h.state)},
        {"started", timestampToJson(h.started)},
        {"completed", timestampToJson(h.completed)},
        {"message", h.message},
        {"success", h.success},
    };
}

inline void to_json(nlohmann::json& j, const EventSnapshot& s) {
    nlohmann::json handlers = nlohmann::json::object();
    for (auto bucket : {Bucket::Incomplete, Bucket::Complete, Bucket::Failed}) {
        handlers[std::string(bucketToString(bucket))] = s.bucket(bucket);
    }
    j = nlohmann::json{{"type", s.type}, {"handlers", std::move(handlers)}};
}

inline void to_json(nlohmann::json& j, const DispatchSummary& s) {
    j = nlohmann::json{
        {"executed", s.executed}, {"completed", s.completed}, {"failed", s.failed}, {"halted", s.halted}};
}

} // namespace fleet
