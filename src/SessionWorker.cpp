#include "SessionWorker.hpp"
#include <iostream>

SessionWorker::SessionWorker()
  : work_(boost::asio::make_work_guard(io_)),
    thread_([this]() { run(); }) {}

SessionWorker::~SessionWorker() {
  work_.reset();
  if (thread_.joinable()) thread_.join();
}

void SessionWorker::run() {
  // keep serving after a throwing callback
  for (;;) {
    try {
      io_.run();
      break;
    } catch (const std::exception& e) {
      std::cerr << "Error in session worker: " << e.what() << "\n";
    }
  }
}

void SessionWorker::post(const SensorFrame& f) {
  boost::asio::post(io_, [this, f]() { session_.process(f); });
}

void SessionWorker::start(const MotionProfile& profile, double arm_length_m) {
  run_sync([this, &profile, arm_length_m]() { session_.start(profile, arm_length_m); });
}

int SessionWorker::end() {
  return run_sync([this]() { return session_.end(); });
}

void SessionWorker::reset() {
  run_sync([this]() { session_.reset(); });
}

void SessionWorker::drain() {
  run_sync([]() {});
}
