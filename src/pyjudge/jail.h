#ifndef PYJUDGE_JAIL_H_
#define PYJUDGE_JAIL_H_

#include <cstdint>
#include <string>
#include <vector>

#include <cjail/cjail.h>

class JailOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class JailOptions;
};

// How pyjudge-jail starts one runner. Open descriptors (the channel included)
// are preserved into the jail.
class JailOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  std::vector<std::string> dirs; // bind-mounted from the host at the same path

  JailOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  explicit JailOptions(const std::vector<uint8_t>& serial);

  // drop dirs missing on the host or already covered by another entry
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated after reassignment/reallocation of any string/vector member
  void ToCJailCtx(CJailCtxClass& ret) const;
};

#endif  // PYJUDGE_JAIL_H_
