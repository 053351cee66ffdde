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

#include "board/board.hpp"
#include "bringup/discovery.hpp"
#include "bringup/firmware.hpp"
#include "core/retry.hpp"
#include "core/status.hpp"
#include "services/daemon.hpp"
#include "services/events.hpp"
#include "services/settings.hpp"

#include <string_view>
#include <utility>

namespace pandad::bringup {

inline constexpr std::string_view kHeartbeatLostKey = "PandaHeartbeatLost";

struct SupervisorDeps {
  board::IBoardDriver& driver;
  const FirmwareResolver& firmware;
  services::ISettingsStore& settings;
  services::IEventSink& events;
  services::IDaemonLauncher& daemon;
  core::Sleeper sleep;
};

class Supervisor {
 public:
  explicit Supervisor(SupervisorDeps deps, DiscoveryCfg cfg = {}) : d_(std::move(deps)), cfg_(cfg) {}

  // discover -> flash -> health -> reset -> order -> close -> run daemon
  core::Result<services::ExitStatus> run_once();

  // Repeats run_once() until a fatal error; daemon exits are not fatal.
  core::Status run_forever();

 private:
  void check_heartbeat_(board::IBoard& b, const board::HealthRecord& h);

  SupervisorDeps d_;
  DiscoveryCfg cfg_;
};

} // namespace pandad::bringup
