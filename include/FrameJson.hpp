#pragma once
#include "PatternConnection.hpp"
#include "RepSession.hpp"
#include "SensorFrame.hpp"
#include <nlohmann/json.hpp>
#include <string>

// One frame: {"t": s, "position": {"x","y","z"}} or
// {"t": s, "landmarks": {"left_wrist": {"x","y","c"}, ...}}.
// False for anything else. Unknown landmark names are skipped.
bool frame_from_json(const nlohmann::json& j, SensorFrame& out);

nlohmann::json frame_to_json(const SensorFrame& f);

// Output lines of the tools.
nlohmann::json rep_event_json(int rep_index, double rom_deg);
nlohmann::json live_rom_json(double rom_deg);
nlohmann::json pattern_event_json(PatternEvent ev, int patterns_completed);
nlohmann::json summary_json(const std::string& profile, const SessionSummary& s);
