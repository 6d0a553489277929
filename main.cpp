#include "Calibration.hpp"
#include "FrameJson.hpp"
#include "MotionProfile.hpp"
#include "SerialPoseSource.hpp"
#include "SessionWorker.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: rep_serial <profile> <port> [baud]\n";
    return 1;
  }

  try {
    MotionProfile profile;
    if (!find_profile(argv[1], profile)) {
      std::cerr << "Unknown profile " << argv[1] << "\n";
      return 1;
    }

    std::string port = argv[2];
    unsigned baud = SerialPoseSource::kDefaultBaud;
    if (argc >= 4) baud = static_cast<unsigned>(std::stoul(argv[3]));

    // on Windows the port is "COM12", not "/dev/COM12"
    SerialPoseSource source(port, baud);
    std::cerr << "Opened serial port " << port << " @ " << baud << "\n";

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
    worker.session().set_trace(&std::cerr);

    worker.start(profile, kDefaultArmLength);

    // serial timing is driven by the device, so no manual sleeps here
    SensorFrame f;
    while (source.next(f)) {
      worker.post(f);
    }

    std::cerr << "Serial stream closed after " << source.skipped() << " unparsable lines\n";
    worker.end();
    std::cout << summary_json(profile.name, worker.session().summary()).dump() << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error in main: " << e.what() << "\n";
    return 1;
  }
}
