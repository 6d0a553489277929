#pragma once
#include "SensorFrame.hpp"

class IPoseSource {
public:
  virtual ~IPoseSource() = default;
  // false once the source has no more frames
  virtual bool next(SensorFrame& out) = 0;
};
