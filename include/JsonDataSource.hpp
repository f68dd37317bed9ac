#pragma once
#include "IDataSource.hpp"
#include <string>
#include <vector>

// Replays a recorded session: a JSON array of frames.
class JsonDataSource : public IDataSource {
public:
  explicit JsonDataSource(const std::string& path);
  bool next(PoseFrame& out) override;

  size_t size() const { return frames_.size(); }

private:
  std::vector<PoseFrame> frames_;
  size_t idx_ = 0;
};
