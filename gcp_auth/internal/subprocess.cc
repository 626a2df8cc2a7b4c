// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gcp_auth/internal/subprocess.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

bool Retry(int e) { return e == EINTR || e == EAGAIN || e == EWOULDBLOCK; }

Status OsError(int e, char const* where, std::string const& executable) {
  return SubprocessError(
      absl::StrCat(where, " failed for ", executable, ": ", std::strerror(e)),
      GCP_AUTH_ERROR_INFO().WithMetadata("errno", std::to_string(e)));
}

// Owns a file descriptor, closing it on destruction.
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(UniqueFd&& rhs) noexcept : fd_(rhs.release()) {}
  UniqueFd& operator=(UniqueFd&& rhs) noexcept {
    reset(rhs.release());
    return *this;
  }
  UniqueFd(UniqueFd const&) = delete;
  UniqueFd& operator=(UniqueFd const&) = delete;
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  int release() {
    auto fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1) {
    if (fd_ != -1) ::close(fd_);
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

struct FileActions {
  FileActions() { posix_spawn_file_actions_init(&actions); }
  ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
  posix_spawn_file_actions_t actions;
};

// Reads from both pipes until the child closes them.
Status DrainPipes(UniqueFd out, UniqueFd err, SubprocessOutput& output,
                  std::string const& executable) {
  std::array<pollfd, 2> fds{{{out.get(), POLLIN, 0}, {err.get(), POLLIN, 0}}};
  std::array<std::string*, 2> sinks{{&output.stdout_data, &output.stderr_data}};
  std::array<char, 4096> buffer;
  auto open_count = fds.size();
  while (open_count != 0) {
    auto r = ::poll(fds.data(), fds.size(), -1);
    if (r < 0) {
      if (Retry(errno)) continue;
      return OsError(errno, "poll()", executable);
    }
    for (std::size_t i = 0; i != fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      auto n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n < 0 && Retry(errno)) continue;
      if (n < 0) return OsError(errno, "read()", executable);
      if (n == 0) {
        fds[i].fd = -1;
        --open_count;
        continue;
      }
      sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
    }
  }
  return Status{};
}

StatusOr<int> WaitForExit(pid_t pid, std::string const& executable) {
  int status;
  while (true) {
    auto r = ::waitpid(pid, &status, 0);
    if (r < 0 && Retry(errno)) continue;
    if (r < 0) return OsError(errno, "waitpid()", executable);
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -1;
  }
}

}  // namespace

StatusOr<SubprocessOutput> RunSubprocess(
    std::string const& executable, std::vector<std::string> const& args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(executable.c_str()));
  for (auto const& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  std::array<int, 2> out_pipe;
  if (::pipe(out_pipe.data()) != 0) return OsError(errno, "pipe()", executable);
  UniqueFd out_read(out_pipe[0]);
  UniqueFd out_write(out_pipe[1]);
  std::array<int, 2> err_pipe;
  if (::pipe(err_pipe.data()) != 0) return OsError(errno, "pipe()", executable);
  UniqueFd err_read(err_pipe[0]);
  UniqueFd err_write(err_pipe[1]);

  FileActions fa;
  posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&fa.actions, out_write.get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&fa.actions, err_write.get(), STDERR_FILENO);
  posix_spawn_file_actions_addclose(&fa.actions, out_read.get());
  posix_spawn_file_actions_addclose(&fa.actions, err_read.get());
  posix_spawn_file_actions_addclose(&fa.actions, out_write.get());
  posix_spawn_file_actions_addclose(&fa.actions, err_write.get());

  pid_t pid;
  auto r = ::posix_spawn(&pid, executable.c_str(), &fa.actions, nullptr,
                         argv.data(), environ);
  if (r != 0) return OsError(r, "posix_spawn()", executable);
  // The child has its own copies, closing ours lets the reads reach EOF.
  out_write.reset();
  err_write.reset();

  SubprocessOutput output{-1, {}, {}};
  auto drained = DrainPipes(std::move(out_read), std::move(err_read), output,
                            executable);
  auto exit_code = WaitForExit(pid, executable);
  if (!drained.ok()) return drained;
  if (!exit_code) return std::move(exit_code).status();
  output.exit_code = *exit_code;
  return output;
}

absl::optional<std::string> FindExecutable(std::string const& name,
                                           std::string const& path_env) {
  for (auto dir : absl::StrSplit(path_env, ':', absl::SkipEmpty())) {
    auto candidate = absl::StrCat(dir, "/", name);
    struct stat sb;
    if (::stat(candidate.c_str(), &sb) != 0) continue;
    if (!S_ISREG(sb.st_mode)) continue;
    if ((sb.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) == 0) continue;
    return candidate;
  }
  return absl::nullopt;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
