#include "utils.h"

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <cstring>
#include <random>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

// async-signal-safe; used between fork and exec
int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, (unsigned)minfd, ~0U, 0) == 0) return 0;
#endif
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  int maxfd = lim.rlim_cur == RLIM_INFINITY || lim.rlim_cur > 1 << 20 ?
      1 << 20 : (int)lim.rlim_cur;
  for (int fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_PARSE_ARG2(cls, x, y, ...) if (str == y) { ret = cls::x; return true; }

#define X(...) X_RETURN_ARG2(PolicyMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* PolicyModeName, PolicyMode, ENUM_POLICY_MODE_)
#undef X
#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X
#define X(...) X_RETURN_ARG2(EnvCreator, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* EnvCreatorName, EnvCreator, ENUM_ENV_CREATOR_)
#undef X
#define X(...) X_RETURN_ARG2(ContainerState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ContainerStateName, ContainerState, ENUM_CONTAINER_STATE_)
#undef X

bool ParsePolicyMode(const std::string& str, PolicyMode& ret) {
#define X(...) X_PARSE_ARG2(PolicyMode, __VA_ARGS__)
  ENUM_POLICY_MODE_
#undef X
  return false;
}

bool ParseErrorKind(const std::string& str, ErrorKind& ret) {
#define X(...) X_PARSE_ARG2(ErrorKind, __VA_ARGS__)
  ENUM_ERROR_KIND_
#undef X
  return false;
}

bool ParseEnvCreator(const std::string& str, EnvCreator& ret) {
#define X(...) X_PARSE_ARG2(EnvCreator, __VA_ARGS__)
  ENUM_ENV_CREATOR_
#undef X
  return false;
}

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_PARSE_ARG2

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

fs::path MakeTempDir(const fs::path& parent, const std::string& prefix) {
  if (!CreateDirs(parent)) return fs::path();
  std::string tmpl = (parent / (prefix + "XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating temporary directory under {}: {}", parent.c_str(), strerror(errno));
    return fs::path();
  }
  return tmpl;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) goto err;
  if (!WriteAll(fd, content.data(), content.size())) {
    close(fd);
    goto err;
  }
  close(fd);
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool ReadAll(int fd, std::string& out) {
  char buf[65536];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return true;
    out.append(buf, n);
  }
}

bool WriteAll(int fd, const char* buf, size_t len) {
  while (len) {
    ssize_t n = write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += n;
    len -= n;
  }
  return true;
}

bool PumpIo(int in_fd, const std::string& input, int out_fd, std::string& out,
            int err_fd, std::string& err, size_t max_output,
            std::chrono::steady_clock::time_point deadline) {
  size_t written = 0;
  if (in_fd >= 0 && input.empty()) {
    close(in_fd);
    in_fd = -1;
  }
  if (in_fd >= 0) fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
  std::string* sinks[2] = {&out, &err};
  int fds[2] = {out_fd, err_fd};
  char buf[65536];
  while (in_fd >= 0 || fds[0] >= 0 || fds[1] >= 0) {
    struct pollfd pfd[3];
    int idx[3], n = 0;
    if (in_fd >= 0) pfd[n] = {in_fd, POLLOUT, 0}, idx[n++] = -1;
    for (int i = 0; i < 2; i++) {
      if (fds[i] >= 0) pfd[n] = {fds[i], POLLIN, 0}, idx[n++] = i;
    }
    int timeout = -1;
    if (deadline != std::chrono::steady_clock::time_point::max()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) goto timeout;
      timeout = (int)std::min<long>(left, 1'000'000);
    }
    int ret = poll(pfd, n, timeout);
    if (ret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      goto timeout;
    }
    for (int j = 0; j < n; j++) {
      if (!pfd[j].revents) continue;
      if (idx[j] == -1) {
        ssize_t w = write(in_fd, input.data() + written, input.size() - written);
        if (w > 0) written += w;
        if ((w < 0 && errno != EAGAIN && errno != EINTR) || written == input.size()) {
          // EPIPE: the child does not want the rest
          close(in_fd);
          in_fd = -1;
        }
        continue;
      }
      int i = idx[j];
      ssize_t r = read(fds[i], buf, sizeof(buf));
      if (r < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (r <= 0) {
        fds[i] = -1;
        continue;
      }
      std::string& sink = *sinks[i];
      if (!max_output || sink.size() < max_output) {
        size_t take = max_output ? std::min<size_t>(r, max_output - sink.size()) : r;
        sink.append(buf, take);
      }
    }
  }
  return true;
timeout:
  if (in_fd >= 0) close(in_fd);
  return false;
}

std::string TruncateUtf8(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) return str;
  size_t end = max_bytes;
  // back off continuation bytes, then drop the lead byte of the cut sequence
  size_t pos = end;
  while (pos > 0 && (static_cast<unsigned char>(str[pos - 1]) & 0xC0) == 0x80) pos--;
  if (pos > 0) {
    unsigned char lead = str[pos - 1];
    size_t need = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    if (end - (pos - 1) < need) end = pos - 1;
  }
  return str.substr(0, end);
}

std::string Trim(const std::string& str) {
  const char* kSpace = " \t\r\n\f\v";
  size_t first = str.find_first_not_of(kSpace);
  if (first == std::string::npos) return "";
  return str.substr(first, str.find_last_not_of(kSpace) - first + 1);
}

std::vector<std::string> Split(const std::string& str, char delim) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delim, start);
    ret.push_back(str.substr(start, pos == std::string::npos ? pos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return ret;
}

std::string RandomHex(size_t len) {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  const char kDigits[] = "0123456789abcdef";
  std::string ret(len, '0');
  for (auto& i : ret) i = kDigits[gen() & 15];
  return ret;
}

std::string Sha256Hex(const std::string& str) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(str.data(), str.size(), digest, &len, EVP_sha256(), nullptr)) {
    spdlog::error("EVP_Digest failed");
    return "";
  }
  std::string ret;
  ret.reserve(len * 2);
  for (unsigned int i = 0; i < len; i++) ret += fmt::format("{:02x}", digest[i]);
  return ret;
}

long UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

ScopedFileLock::ScopedFileLock(const fs::path& path) : fd_(-1) {
  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    spdlog::warn("Cannot open lock file {}: {}", path.c_str(), strerror(errno));
    return;
  }
  // open file description lock: also excludes other threads of this process
  struct flock lock;
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;
  lock.l_pid = 0;
  while (fcntl(fd, F_OFD_SETLKW, &lock) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("Cannot lock {}: {}", path.c_str(), strerror(errno));
    close(fd);
    return;
  }
  fd_ = fd;
}

ScopedFileLock::~ScopedFileLock() {
  if (fd_ >= 0) close(fd_);
}
