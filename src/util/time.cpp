// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace sniffer {
namespace util {

// Mock time in microseconds since epoch; 0 means real time
static std::atomic<int64_t> g_mock_time_us{0};

// Steady clock reference captured when mock time is first observed
// Protected by g_steady_mutex
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference_us{0};
static bool g_steady_initialized{false};

int64_t GetTimeMicros() {
  int64_t mock = g_mock_time_us.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTime() {
  return GetTimeMicros() / 1'000'000;
}

Timestamp GetWallClock() {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds{GetTimeMicros()})};
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time_us.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);

    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference_us = mock;
      g_steady_initialized = true;
    }

    return g_real_steady_reference + std::chrono::microseconds(mock - g_mock_steady_reference_us);
  }

  return std::chrono::steady_clock::now();
}

void SetMockTimeMicros(int64_t micros) {
  g_mock_time_us.store(micros, std::memory_order_relaxed);

  // Keep the steady reference while mock time moves so intervals stay consistent
  if (micros == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

void SetMockTime(int64_t time) {
  SetMockTimeMicros(time * 1'000'000);
}

int64_t GetMockTime() {
  return g_mock_time_us.load(std::memory_order_relaxed) / 1'000'000;
}

MockTimeScope::MockTimeScope(int64_t time) : previous_micros_(g_mock_time_us.load(std::memory_order_relaxed)) {
  SetMockTime(time);
}

MockTimeScope::~MockTimeScope() {
  SetMockTimeMicros(previous_micros_);
}

Timestamp FromEpochSeconds(double seconds) {
  auto micros = static_cast<int64_t>(seconds * 1'000'000.0 + (seconds >= 0 ? 0.5 : -0.5));
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds{micros})};
}

double ToEpochSeconds(Timestamp t) {
  return std::chrono::duration<double>(t.time_since_epoch()).count();
}

double SecondsBetween(Timestamp from, Timestamp to) {
  return std::chrono::duration<double>(to - from).count();
}

std::string FormatTime(int64_t unix_time) {
  if (unix_time == 0) {
    return "1970-01-01 00:00:00 UTC";
  }

  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << " "
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << " UTC";
  return oss.str();
}

static std::string FormatLocal(Timestamp t, const char* format) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, format);
  return oss.str();
}

std::string FormatClockTime(Timestamp t) {
  return FormatLocal(t, "%H:%M:%S");
}

std::string FormatDateTime(Timestamp t) {
  return FormatLocal(t, "%Y-%m-%d_%H:%M:%S");
}

}  // namespace util
}  // namespace sniffer
