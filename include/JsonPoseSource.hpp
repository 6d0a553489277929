#pragma once
#include "IPoseSource.hpp"
#include <string>
#include <vector>

// Recorded session: a JSON array of frames, replayed in file order.
class JsonPoseSource : public IPoseSource {
public:
  explicit JsonPoseSource(const std::string& path);
  bool next(SensorFrame& out) override;

  size_t size() const { return frames_.size(); }
  // array entries that were not frames
  size_t skipped() const { return skipped_; }

private:
  std::vector<SensorFrame> frames_;
  size_t idx_ = 0;
  size_t skipped_ = 0;
};
