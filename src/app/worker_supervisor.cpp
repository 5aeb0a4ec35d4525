// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/worker_supervisor.hpp"

#include "util/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>

namespace sniffer {
namespace app {

WorkerSupervisor::WorkerSupervisor(util::StopSignal& stop) : stop_(stop) {}

WorkerSupervisor::~WorkerSupervisor() {
  stop_.RequestStop();
  auto stragglers = JoinAll(DEFAULT_GRACE);
  if (!stragglers.empty()) {
    TerminateProcess(EXIT_FAILURE);
  }
}

void WorkerSupervisor::Spawn(std::string name, std::function<void()> body) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = std::make_unique<Worker>();
  worker->name = std::move(name);
  Worker* raw = worker.get();
  workers_.push_back(std::move(worker));
  raw->thread = std::thread([this, raw, body = std::move(body)]() { RunWorker(raw, body); });
  LOG_APP_DEBUG("Started worker {}", raw->name);
}

void WorkerSupervisor::RunWorker(Worker* worker, const std::function<void()>& body) {
  std::string failure;
  try {
    body();
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "non-standard exception";
  }

  if (!failure.empty()) {
    LOG_APP_ERROR("Worker {} crashed: {}", worker->name, failure);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      failures_.push_back(WorkerFailure{worker->name, failure});
    }
    stop_.RequestStop();
  }

  MarkFinished(worker);
}

void WorkerSupervisor::MarkFinished(Worker* worker) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker->finished = true;
  }
  finished_cv_.notify_all();
}

bool WorkerSupervisor::Crashed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !failures_.empty();
}

std::vector<WorkerFailure> WorkerSupervisor::Failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

size_t WorkerSupervisor::RunningCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t running = 0;
  for (const auto& worker : workers_) {
    if (worker->thread.joinable() && !worker->finished) {
      ++running;
    }
  }
  return running;
}

std::vector<std::string> WorkerSupervisor::JoinAll(std::chrono::milliseconds grace) {
  auto deadline = std::chrono::steady_clock::now() + grace;

  std::vector<std::string> stragglers;
  std::unique_lock<std::mutex> lock(mutex_);
  for (size_t i = 0; i < workers_.size(); ++i) {
    Worker* raw = workers_[i].get();
    if (!raw->thread.joinable()) {
      continue;
    }

    finished_cv_.wait_until(lock, deadline, [raw] { return raw->finished; });

    if (raw->finished) {
      // Only the epilogue after MarkFinished() remains; join without the lock
      std::thread thread = std::move(raw->thread);
      lock.unlock();
      thread.join();
      lock.lock();
    } else {
      LOG_APP_WARN("Worker {} did not stop within {}ms", raw->name, grace.count());
      stragglers.push_back(raw->name);
    }
  }
  return stragglers;
}

void TerminateProcess(int exit_code) {
  util::LogManager::Shutdown();
  std::fflush(stdout);
  std::fflush(stderr);
  std::_Exit(exit_code);
}

}  // namespace app
}  // namespace sniffer
