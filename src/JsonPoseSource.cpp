#include "JsonPoseSource.hpp"
#include "FrameJson.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

JsonPoseSource::JsonPoseSource(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open JSON file " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
  }
  if (!j.is_array()) throw std::runtime_error("JSON must be an array of frames");

  frames_.reserve(j.size());
  for (const auto& item : j) {
    SensorFrame fr;
    if (frame_from_json(item, fr)) {
      frames_.push_back(fr);
    } else {
      skipped_++;
    }
  }
}

bool JsonPoseSource::next(SensorFrame& out) {
  if (idx_ >= frames_.size()) return false;
  out = frames_[idx_++];
  return true;
}
