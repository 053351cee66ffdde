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

#include "services/settings.hpp"

#include "platform/posix-common/filehandle.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace pandad::services {

namespace fs = std::filesystem;

core::Status FileSettingsStore::put_bool(std::string_view key, bool value) {
  if (key.empty() || key.find('/') != std::string_view::npos)
    return core::Status::Failf(core::ErrorKind::Usage, "Invalid settings key: '{}'", key);

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) return core::Status::Failf(core::ErrorKind::Io, "Cannot create {}: {}", dir_.string(), ec.message());

  const fs::path dst = dir_ / std::string(key);
  const fs::path tmp = dir_ / (".tmp_" + std::string(key) + "_" + std::to_string(::getpid()));

  FileHandle fh = do_open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (!fh.valid()) return core::Status::Failf(core::ErrorKind::Io, "open {}: {}", tmp.string(), std::strerror(errno));

  const char byte = value ? '1' : '0';
  const bool wrote = fh.write(&byte, 1) == 1 && fh.fsync() == 0;
  const int werr = errno;
  fh.close();

  if (!wrote) {
    ::unlink(tmp.c_str());
    return core::Status::Failf(core::ErrorKind::Io, "write {}: {}", tmp.string(), std::strerror(werr));
  }

  if (::rename(tmp.c_str(), dst.c_str()) != 0) {
    const int e = errno;
    ::unlink(tmp.c_str());
    return core::Status::Failf(core::ErrorKind::Io, "rename {} -> {}: {}", tmp.string(), dst.string(), std::strerror(e));
  }

  spdlog::debug("Settings: {} = {}", key, value);
  return core::Status::Ok();
}

} // namespace pandad::services
