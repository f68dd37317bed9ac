#pragma once
#include "PoseFrame.hpp"

class IDataSource {
public:
  virtual ~IDataSource() = default;
  // false once the stream is exhausted
  virtual bool next(PoseFrame& out) = 0;
};
