#include "SessionWorker.hpp"
#include "TestFrames.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace test_frames;

namespace {
MotionProfile profile(const char* name) {
  MotionProfile p;
  EXPECT_TRUE(find_profile(name, p)) << name;
  return p;
}
}  // namespace

TEST(SessionWorker, ProcessesInPostedOrder) {
  SessionWorker worker;
  std::vector<int> reps;
  std::thread::id callback_thread;
  worker.session().on_rep([&](int i, double) {
    reps.push_back(i);
    callback_thread = std::this_thread::get_id();
  });
  worker.start(profile("forward_swing"), 0.7);

  for (const auto& f : pendulum(3)) worker.post(f);
  EXPECT_EQ(worker.end(), 3);

  EXPECT_EQ(reps, (std::vector<int>{1, 2, 3}));
  EXPECT_NE(callback_thread, std::this_thread::get_id());
  EXPECT_NEAR(worker.session().summary().rom_per_rep.at(0), (1.0 / 0.7) * 180.0 / kPi, 1e-6);
}

TEST(SessionWorker, DrainWaitsForQueuedFrames) {
  SessionWorker worker;
  worker.start(profile("follow_circle"), 0.7);
  for (const auto& f : circle_xz(91)) worker.post(f);
  worker.drain();
  EXPECT_EQ(worker.session().rep_count(), 1);
}

TEST(SessionWorker, ResetRunsAfterQueuedFrames) {
  SessionWorker worker;
  worker.start(profile("forward_swing"), 0.7);
  for (const auto& f : pendulum(2)) worker.post(f);
  worker.reset();
  EXPECT_EQ(worker.session().rep_count(), 0);
  EXPECT_FALSE(worker.session().active());

  worker.start(profile("forward_swing"), 0.7);
  for (const auto& f : pendulum(1, 0.5, 10.0)) worker.post(f);
  EXPECT_EQ(worker.end(), 1);
}

TEST(SessionWorker, SeveralProducers) {
  SessionWorker worker;
  std::atomic<int> live{0};
  worker.session().on_live_rom([&](double) { live++; });
  worker.start(profile("forward_swing"), 0.7);

  // independent producers only share the queue; each posts small steps
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&worker, p]() {
      for (int i = 0; i < 50; ++i) worker.post(position(0.001 * i, 0.01 * p, 0.0, i / 60.0));
    });
  }
  for (auto& t : producers) t.join();
  worker.drain();
  EXPECT_EQ(live.load(), 200);
}

TEST(SessionWorker, DestructionDrainsQueue) {
  std::atomic<int> reps{0};
  {
    SessionWorker worker;
    worker.session().on_rep([&](int, double) { reps++; });
    worker.start(profile("forward_swing"), 0.7);
    for (const auto& f : pendulum(2)) worker.post(f);
  }
  EXPECT_EQ(reps.load(), 2);
}
