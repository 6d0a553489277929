#include "Calibration.hpp"
#include "FrameJson.hpp"
#include "JsonPoseSource.hpp"
#include "MotionProfile.hpp"
#include "SessionWorker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A built-in profile name, or a JSON file of overrides ({"base": "stir", ...}).
MotionProfile load_profile(const std::string& arg) {
  MotionProfile profile;
  if (find_profile(arg, profile)) return profile;
  if (!ends_with(arg, ".json")) throw std::runtime_error("Unknown profile " + arg);

  std::ifstream f(arg);
  if (!f.is_open()) throw std::runtime_error("Could not open profile file " + arg);
  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Malformed profile file " + arg + ": " + e.what());
  }
  find_profile("custom", profile);
  apply_profile_overrides(profile, j);
  return profile;
}

double load_arm(const std::string& arg) {
  if (ends_with(arg, ".json")) {
    double arm = 0.0;
    if (!load_arm_length(arg, arm)) {
      std::cerr << "No arm length in " << arg << ", using " << kDefaultArmLength << " m\n";
      return kDefaultArmLength;
    }
    return resolve_arm_length(arm);
  }
  try {
    return resolve_arm_length(std::stod(arg));
  } catch (const std::logic_error&) {
    throw std::runtime_error("Arm length must be a number or a calibration file: " + arg);
  }
}

void usage() {
  std::cerr << "usage: rep_replay [--realtime] <profile|profile.json> <frames.json> "
               "[arm_length_m|calibration.json]\n"
            << "profiles:";
  for (const auto& name : profile_names()) std::cerr << " " << name;
  std::cerr << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    int arg = 1;
    bool realtime = false;
    if (arg < argc && std::string(argv[arg]) == "--realtime") {
      realtime = true;
      arg++;
    }
    if (argc - arg < 2) {
      usage();
      return 1;
    }

    MotionProfile profile = load_profile(argv[arg]);
    JsonPoseSource source(argv[arg + 1]);
    double arm = (argc - arg >= 3) ? load_arm(argv[arg + 2]) : kDefaultArmLength;

    if (source.skipped() > 0) {
      std::cerr << "Skipped " << source.skipped() << " malformed frames\n";
    }

    SessionWorker worker;
    worker.session().on_rep([](int rep, double rom) {
      std::cout << rep_event_json(rep, rom).dump() << std::endl;
    });
    worker.session().on_live_rom([](double rom) {
      std::cout << live_rom_json(rom).dump() << std::endl;
    });
    worker.session().on_pattern([](PatternEvent ev, int completed) {
      std::cout << pattern_event_json(ev, completed).dump() << std::endl;
    });

    worker.start(profile, arm);

    SensorFrame f;
    bool has_last = false;
    double last_t = 0.0;
    while (source.next(f)) {
      // keep the recording's spacing
      if (realtime && has_last && f.t > last_t) {
        worker.drain();
        std::this_thread::sleep_for(std::chrono::duration<double>(f.t - last_t));
      }
      has_last = true;
      last_t = f.t;
      worker.post(f);
    }

    worker.end();
    std::cout << summary_json(profile.name, worker.session().summary()).dump() << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
