// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sniffer {
namespace util {

// Write via temp file + fsync + rename so readers never see a partial file.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Whole file as a string, nullopt if it cannot be read.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Append one line, adding a separating newline first if the file does not end with one.
bool append_line(const std::filesystem::path& path, const std::string& line);

bool ensure_directory(const std::filesystem::path& dir);

// ~/.session_sniffer on Linux/Unix, ~/Library/Application Support/SessionSniffer on macOS.
// Empty path if HOME is not set.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace sniffer
