// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>

namespace sniffer {
namespace util {

namespace {

// UserIP databases and mod-menu logs are small text files; anything larger is not ours
constexpr std::uintmax_t MAX_TEXT_FILE_SIZE = 64 * 1024 * 1024;

// Owns a POSIX descriptor; closes it on scope exit
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Close explicitly so the error is seen (data may be flushed at close)
  bool close() {
    int fd = fd_;
    fd_ = -1;
    return ::close(fd) == 0;
  }

private:
  int fd_;
};

bool write_fully(int fd, const std::string& data) {
  const char* cursor = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, cursor, remaining);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    cursor += n;
    remaining -= static_cast<size_t>(n);
  }
  return true;
}

bool flush_to_disk(int fd) {
#if defined(__APPLE__)
  return ::fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return ::fsync(fd) == 0;
#endif
}

// <name>.<pid>.<n>.tmp beside the target, unique per process and call
std::filesystem::path temp_sibling(const std::filesystem::path& path) {
  static std::atomic<uint64_t> counter{0};
  auto temp = path;
  temp += fmt::format(".{}.{}.tmp", ::getpid(), counter.fetch_add(1));
  return temp;
}

bool make_parent(const std::filesystem::path& path, const char* caller) {
  auto parent = path.parent_path();
  if (parent.empty() || ensure_directory(parent)) {
    return true;
  }
  LOG_ERROR("{}: cannot create directory {}", caller, parent.string());
  return false;
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  if (!make_parent(path, "atomic_write_file")) {
    return false;
  }

  const auto temp = temp_sibling(path);
  FileDescriptor fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode));
  if (!fd.valid()) {
    LOG_ERROR("atomic_write_file: cannot create {}: {}", temp.string(), std::strerror(errno));
    return false;
  }

  const char* failed_step = nullptr;
  if (!write_fully(fd.get(), data)) {
    failed_step = "write";
  } else if (!flush_to_disk(fd.get())) {
    failed_step = "fsync";
  } else if (!fd.close()) {
    failed_step = "close";
  }
  if (failed_step) {
    LOG_ERROR("atomic_write_file: {} of {} failed: {}", failed_step, temp.string(), std::strerror(errno));
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: cannot move {} over {}: {}", temp.string(), path.string(), ec.message());
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return false;
  }
  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_DEBUG("read_file_string: {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > MAX_TEXT_FILE_SIZE) {
    LOG_ERROR("read_file_string: {} is {} bytes, limit is {}", path.string(), size, MAX_TEXT_FILE_SIZE);
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  std::string contents(static_cast<size_t>(size), '\0');
  if (!in || !in.read(contents.data(), static_cast<std::streamsize>(size))) {
    LOG_ERROR("read_file_string: cannot read {}", path.string());
    return std::nullopt;
  }
  return contents;
}

bool append_line(const std::filesystem::path& path, const std::string& line) {
  if (!make_parent(path, "append_line")) {
    return false;
  }

  FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (!fd.valid()) {
    LOG_ERROR("append_line: cannot open {}: {}", path.string(), std::strerror(errno));
    return false;
  }

  // A previous writer may have stopped mid-line
  std::string record;
  off_t end = ::lseek(fd.get(), 0, SEEK_END);
  char last = '\n';
  if (end > 0 && ::pread(fd.get(), &last, 1, end - 1) == 1 && last != '\n') {
    record.push_back('\n');
  }
  record += line;
  record.push_back('\n');

  // One write() per record so concurrent appenders never interleave within a line
  if (!write_fully(fd.get(), record) || !fd.close()) {
    LOG_ERROR("append_line: write to {} failed: {}", path.string(), std::strerror(errno));
    return false;
  }
  return true;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    LOG_ERROR("HOME is not set; pass --datadir to choose the data directory");
    return {};
  }
#if defined(__APPLE__)
  return std::filesystem::path(home) / "Library" / "Application Support" / "SessionSniffer";
#else
  return std::filesystem::path(home) / ".session_sniffer";
#endif
}

}  // namespace util
}  // namespace sniffer
