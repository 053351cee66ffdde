/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "services/daemon.hpp"

#include "platform/posix-common/filehandle.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace pandad::services {

std::string ExitStatus::describe() const {
  if (signal) return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
  return fmt::format("exit code {}", code);
}

core::Result<ExitStatus> ProcessLauncher::launch(const std::vector<std::string>& args) {
  using R = core::Result<ExitStatus>;

  // Child reports a failed chdir/exec through this pipe; a clean exec closes it.
  FileHandle rd, wr;
  if (!FileHandle::pipe(rd, wr)) return R::Failf(core::ErrorKind::Io, "pipe2: {}", std::strerror(errno));

  std::vector<std::string> argv_store;
  argv_store.reserve(args.size() + 1);
  argv_store.push_back(exe_.string());
  argv_store.insert(argv_store.end(), args.begin(), args.end());

  std::vector<char*> argv;
  argv.reserve(argv_store.size() + 1);
  for (auto& a : argv_store) argv.push_back(a.data());
  argv.push_back(nullptr);

  spdlog::info("Starting {} in {} with [{}]", exe_.string(), workdir_.string(), fmt::join(args, " "));

  const pid_t pid = ::fork();
  if (pid < 0) return R::Failf(core::ErrorKind::Io, "fork: {}", std::strerror(errno));

  if (pid == 0) {
    rd.close();
    int err = 0;
    if (::chdir(workdir_.c_str()) != 0) {
      err = errno;
    } else {
      ::execv(argv[0], argv.data());
      err = errno;
    }
    (void)wr.write(&err, sizeof(err));
    ::_exit(127);
  }

  wr.close();

  int child_err = 0;
  const ssize_t n = do_read(rd, &child_err, sizeof(child_err));

  int wstatus = 0;
  pid_t w = 0;
  do {
    w = ::waitpid(pid, &wstatus, 0);
  } while (w < 0 && errno == EINTR);
  if (w < 0) return R::Failf(core::ErrorKind::Io, "waitpid: {}", std::strerror(errno));

  if (n == static_cast<ssize_t>(sizeof(child_err)))
    return R::Failf(core::ErrorKind::Io, "Cannot start {} in {}: {}", exe_.string(), workdir_.string(), std::strerror(child_err));

  ExitStatus es;
  if (WIFEXITED(wstatus)) es.code = WEXITSTATUS(wstatus);
  else if (WIFSIGNALED(wstatus)) es.signal = WTERMSIG(wstatus);
  return R::Ok(es);
}

} // namespace pandad::services
