#pragma once
#include "PushupSession.hpp"
#include <iosfwd>

// Writes one JSON object per line for the Node/frontend side, e.g.
// {"event":"rep","count":3,"milestone":false}
class JsonLineReporter : public SessionListener {
public:
  explicit JsonLineReporter(std::ostream& out) : out_(out) {}

  void onStatusChanged(const SessionStatus& s) override;
  void onRepIncremented(int count, bool milestone) override;
  void onReadinessChanged(bool locked) override;

  void writeSummary(const SessionSummary& s);

private:
  std::ostream& out_;
};
