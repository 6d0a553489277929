#pragma once
#include <string>

// Used whenever no calibrated arm length is available.
constexpr double kDefaultArmLength = 0.7;  // meters

// candidate if finite and > 0, kDefaultArmLength otherwise.
double resolve_arm_length(double candidate);

// Reads {"arm_length_m": x} from path. Returns false when the file or the key
// is missing; throws std::runtime_error on malformed JSON.
bool load_arm_length(const std::string& path, double& out);
