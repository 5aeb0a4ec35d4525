// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sniffer {
namespace util {

// Wall-clock instant used for every packet and lifecycle timestamp.
using Timestamp = std::chrono::system_clock::time_point;

// Current unix time in seconds (mockable).
int64_t GetTime();

// Current unix time in microseconds (mockable).
int64_t GetTimeMicros();

// Current wall clock as a time_point (mockable, microsecond resolution).
Timestamp GetWallClock();

// Monotonic clock for intervals (follows mock time when it is set).
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in seconds. 0 disables mock time.
void SetMockTime(int64_t time);

// Set mock time in microseconds. 0 disables mock time.
void SetMockTimeMicros(int64_t micros);

// Mock time in seconds, 0 if disabled.
int64_t GetMockTime();

// Restores the previous mock time on scope exit (tests).
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time);
  ~MockTimeScope();

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_micros_;
};

// Conversions between capture epoch seconds (fractional) and Timestamp.
Timestamp FromEpochSeconds(double seconds);
double ToEpochSeconds(Timestamp t);

// Seconds elapsed between two instants, as a double.
double SecondsBetween(Timestamp from, Timestamp to);

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// "HH:MM:SS" (local time)
std::string FormatClockTime(Timestamp t);

// "YYYY-MM-DD_HH:MM:SS" (local time)
std::string FormatDateTime(Timestamp t);

}  // namespace util
}  // namespace sniffer
