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

#pragma once

#include "core/status.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace pandad::services {

struct ExitStatus {
  int code = 0;
  int signal = 0; // non-zero when the child was killed by a signal

  bool ok() const noexcept { return code == 0 && signal == 0; }
  std::string describe() const;
};

class IDaemonLauncher {
 public:
  virtual ~IDaemonLauncher() = default;

  // Runs the daemon with `args` as its positional arguments and blocks until it exits.
  virtual core::Result<ExitStatus> launch(const std::vector<std::string>& args) = 0;
};

class ProcessLauncher final : public IDaemonLauncher {
 public:
  ProcessLauncher(std::filesystem::path workdir, std::filesystem::path exe)
    : workdir_(std::move(workdir)), exe_(std::move(exe)) {}

  core::Result<ExitStatus> launch(const std::vector<std::string>& args) override;

 private:
  std::filesystem::path workdir_;
  std::filesystem::path exe_;
};

} // namespace pandad::services
