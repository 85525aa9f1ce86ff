#ifndef SNIPBOX_SANDBOX_H_
#define SNIPBOX_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>

class SandboxOptions;
// Owns the strings a cjail_ctx points into
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
  using Int = long; // serialize
 public:
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1 for not dup
  int uid, gid;
  long wall_time; // us
  long rss, vss; // KiB
  int proc_num; // 0: unlimited
  int file_num;
  long fsize; // KiB

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  explicit SandboxOptions(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the context is valid while this object is unchanged
  void ToCJailCtx(CJailCtxClass& ret) const;
};

#endif  // SNIPBOX_SANDBOX_H_
