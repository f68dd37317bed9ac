#include "JsonLineReporter.hpp"
#include <nlohmann/json.hpp>
#include <ostream>

using nlohmann::json;

void JsonLineReporter::onStatusChanged(const SessionStatus& s) {
  json j = {
    {"event", "status"},
    {"code", statusCodeName(s.code)},
    {"text", s.text},
  };
  if (s.reason != GateReason::None) j["reason"] = gateReasonName(s.reason);
  out_ << j.dump() << std::endl;
}

void JsonLineReporter::onRepIncremented(int count, bool milestone) {
  json j = {
    {"event", "rep"},
    {"count", count},
    {"milestone", milestone},
  };
  out_ << j.dump() << std::endl;
}

void JsonLineReporter::onReadinessChanged(bool locked) {
  json j = {
    {"event", "readiness"},
    {"locked", locked},
  };
  out_ << j.dump() << std::endl;
}

void JsonLineReporter::writeSummary(const SessionSummary& s) {
  json j = {
    {"event", "summary"},
    {"count", s.rep_count},
    {"duration_ms", s.duration_ms},
    {"duration", formatDuration((s.duration_ms + 500) / 1000)},
    {"phase", phaseName(s.phase)},
    {"stage", stageName(s.stage)},
  };
  out_ << j.dump() << std::endl;
}
