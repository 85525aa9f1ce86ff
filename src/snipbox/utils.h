#ifndef SNIPBOX_UTILS_H_
#define SNIPBOX_UTILS_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

#include <snipbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

int CloseFrom(int minfd);
// once per process; writes to closed pipes then fail with EPIPE
void IgnoreSigpipe();

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// mkdtemp under parent; empty path on failure
fs::path MakeTempDir(const fs::path& parent, const std::string& prefix);
bool WriteFile(const fs::path&, const std::string& content);

bool ReadAll(int fd, std::string& out);
bool WriteAll(int fd, const char* buf, size_t len);

// Moves input into in_fd and drains out_fd / err_fd until both reach EOF.
// in_fd is closed once everything is written. Output beyond max_output is read
// and discarded. Returns false if the deadline passed first.
bool PumpIo(int in_fd, const std::string& input, int out_fd, std::string& out,
            int err_fd, std::string& err, size_t max_output,
            std::chrono::steady_clock::time_point deadline);

// never splits a multi-byte sequence
std::string TruncateUtf8(const std::string& str, size_t max_bytes);
std::string Trim(const std::string&);
std::vector<std::string> Split(const std::string&, char delim);
std::string RandomHex(size_t len);
std::string Sha256Hex(const std::string&);
long UnixNow();

// fcntl write lock held for the lifetime of the object
class ScopedFileLock {
  int fd_;
 public:
  explicit ScopedFileLock(const fs::path&);
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;
  ~ScopedFileLock();
  bool Locked() const { return fd_ >= 0; }
};

#endif  // SNIPBOX_UTILS_H_
