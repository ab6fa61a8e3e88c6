#include "jail.h"

#include <cstring>
#include <algorithm>
#include <stdexcept>
#include <filesystem>

JailOptions::JailOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto Take = [&](size_t len) {
    if (len > vec.size() - cur) throw std::out_of_range("truncated jail options");
    const uint8_t* ret = vec.data() + cur;
    cur += len;
    return ret;
  };
  auto ReadInt = [&]() {
    Int r;
    memcpy(&r, Take(sizeof(Int)), sizeof(Int));
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0) throw std::out_of_range("truncated jail options");
    const uint8_t* data = Take(size);
    return std::string((const char*)data, size);
  };
  auto ReadStrings = [&](std::vector<std::string>& out) {
    Int size = ReadInt();
    if (size < 0 || (size_t)size > vec.size()) throw std::out_of_range("truncated jail options");
    out.resize(size);
    for (auto& i : out) i = ReadString();
  };
  boxdir = ReadString();
  ReadStrings(command);
  ReadStrings(envs);
  workdir = ReadString();
  input = ReadString();
  output = ReadString();
  error = ReadString();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  ReadStrings(dirs);
}

std::vector<uint8_t> JailOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  auto PushStrings = [&](const std::vector<std::string>& vec) {
    PushInt(vec.size());
    for (auto& i : vec) PushString(i);
  };
  PushString(boxdir);
  PushStrings(command);
  PushStrings(envs);
  PushString(workdir);
  PushString(input);
  PushString(output);
  PushString(error);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushStrings(dirs);
  return ret;
}

void JailOptions::FilterDirs() {
  std::vector<std::string> sorted = dirs, ret;
  std::sort(sorted.begin(), sorted.end());
  for (auto& i : sorted) {
    std::error_code ec;
    if (!std::filesystem::is_directory(i, ec)) continue;
    bool covered = false;
    for (auto& j : ret) {
      if (i == j || (i.size() > j.size() && i.compare(0, j.size(), j) == 0 &&
                     (j.back() == '/' || i[j.size()] == '/'))) {
        covered = true;
        break;
      }
    }
    if (!covered) ret.push_back(i);
  }
  dirs.swap(ret);
}

void JailOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  // default: cgroup_root
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // default: rlim_stack (no limit)
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // default: cputime_poll_interval
  // default: seccomp_cfg
  // bind mounts
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = i.data();
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
