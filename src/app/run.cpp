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

#include "app/run.hpp"

#include "board/firmware_paths.hpp"
#include "bringup/firmware.hpp"
#include "bringup/supervisor.hpp"
#include "core/retry.hpp"
#include "platform/linux/panda_usb.hpp"
#include "platform/posix-common/single_instance.hpp"
#include "services/daemon.hpp"
#include "services/events.hpp"
#include "services/settings.hpp"

#include <spdlog/spdlog.h>

namespace pandad::app {

RunResult result_for(core::ErrorKind kind) noexcept {
  switch (kind) {
    case core::ErrorKind::None: return RunResult::Success;
    case core::ErrorKind::Usage: return RunResult::InvalidUsage;
    case core::ErrorKind::Io: return RunResult::kIOFail;
    case core::ErrorKind::Transport: return RunResult::kTransportFail;
    case core::ErrorKind::SignatureResolution:
    case core::ErrorKind::StillInBootstub:
    case core::ErrorKind::SignatureMismatchAfterFlash: return RunResult::kFlashFail;
  }
  return RunResult::kIOFail;
}

RunResult run(const Options& opt) {
  auto lock = posix_common::SingleInstanceLock::try_acquire("pandad");
  if (!lock) { spdlog::error("Another instance is already running"); return RunResult::kOtherInstanceRunning; }
  spdlog::debug("Holding instance lock '{}'", lock->name());

  const auto firmware_dir = opt.firmware_path();
  spdlog::debug("Firmware: {}, params: {}, daemon: {} in {}", firmware_dir.string(), opt.params_dir.string(),
                opt.daemon_exe().string(), opt.daemon_workdir().string());

  linux::UsbBoardDriver driver(linux::DriverCfg{.firmware_dir = firmware_dir});
  const bringup::FirmwareResolver firmware(board::default_firmware_paths(firmware_dir));
  services::FileSettingsStore settings(opt.params_dir);
  services::SpdlogEventSink events;
  services::ProcessLauncher daemon(opt.daemon_workdir(), opt.daemon_exe());

  bringup::Supervisor sup(bringup::SupervisorDeps{
    .driver = driver,
    .firmware = firmware,
    .settings = settings,
    .events = events,
    .daemon = daemon,
    .sleep = core::real_sleeper(),
  });

  if (opt.once) {
    auto r = sup.run_once();
    if (!r) {
      spdlog::error("{}", r.st.msg);
      return result_for(r.st.kind);
    }
    return r.value.ok() ? RunResult::Success : RunResult::kDaemonFail;
  }

  const auto st = sup.run_forever();
  spdlog::error("{}", st.msg);
  return result_for(st.kind);
}

} // namespace pandad::app
