// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/stop_signal.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sniffer {
namespace app {

struct WorkerFailure {
  std::string worker;
  std::string what;
};

// WorkerSupervisor - runs each worker on its own thread
//
// An exception escaping a worker body is recorded as that worker's failure,
// marks the supervisor as crashed and requests stop for everyone else.
class WorkerSupervisor {
public:
  static constexpr std::chrono::seconds DEFAULT_GRACE{3};

  explicit WorkerSupervisor(util::StopSignal& stop);

  // Requests stop and joins; ends the process if a worker is still running
  // after DEFAULT_GRACE.
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

  void Spawn(std::string name, std::function<void()> body);

  bool Crashed() const;
  std::vector<WorkerFailure> Failures() const;

  size_t RunningCount() const;

  // Wait up to `grace` for every worker to return. Finished workers are
  // joined; the names of those still running are returned and they stay
  // joinable for a later call.
  std::vector<std::string> JoinAll(std::chrono::milliseconds grace);

private:
  struct Worker {
    std::string name;
    std::thread thread;
    bool finished{false};
  };

  void RunWorker(Worker* worker, const std::function<void()>& body);
  void MarkFinished(Worker* worker);

  util::StopSignal& stop_;

  mutable std::mutex mutex_;
  std::condition_variable finished_cv_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::vector<WorkerFailure> failures_;
};

// Flush logs and end the process immediately with `exit_code`. Used when a
// worker does not return within the shutdown grace period.
[[noreturn]] void TerminateProcess(int exit_code);

}  // namespace app
}  // namespace sniffer
