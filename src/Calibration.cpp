#include "Calibration.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

double resolve_arm_length(double candidate) {
  if (!std::isfinite(candidate) || candidate <= 0.0) return kDefaultArmLength;
  return candidate;
}

bool load_arm_length(const std::string& path, double& out) {
  std::ifstream f(path);
  if (!f.is_open()) return false;

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Malformed calibration file " + path + ": " + e.what());
  }

  if (!j.is_object() || !j.contains("arm_length_m")) return false;
  const auto& v = j["arm_length_m"];
  if (!v.is_number()) throw std::runtime_error("arm_length_m must be a number in " + path);
  out = v.get<double>();
  return true;
}
