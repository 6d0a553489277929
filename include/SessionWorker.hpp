#pragma once
#include "RepSession.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <future>
#include <thread>
#include <utility>

// Runs a RepSession on its own thread. Frames are processed in the order they
// were posted; start/end/reset go through the same queue and block until
// everything posted before them is done. Must not be driven from inside one
// of the session's callbacks.
class SessionWorker {
public:
  SessionWorker();
  ~SessionWorker();
  SessionWorker(const SessionWorker&) = delete;
  SessionWorker& operator=(const SessionWorker&) = delete;

  void post(const SensorFrame& f);

  void start(const MotionProfile& profile, double arm_length_m);
  int end();
  void reset();
  // Blocks until every frame posted so far has been processed.
  void drain();

  // For registering callbacks and reading published values.
  RepSession& session() { return session_; }

private:
  RepSession session_;
  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread thread_;

  void run();

  template <typename F>
  auto run_sync(F fn) -> decltype(fn()) {
    using R = decltype(fn());
    std::packaged_task<R()> task(std::move(fn));
    std::future<R> done = task.get_future();
    boost::asio::post(io_, [&task]() { task(); });
    return done.get();
  }
};
