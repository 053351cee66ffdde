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

#include "bringup/supervisor.hpp"

#include "bringup/ordering.hpp"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace pandad::bringup {

void Supervisor::check_heartbeat_(board::IBoard& b, const board::HealthRecord& h) {
  if (!h.heartbeat_lost) return;

  if (auto st = d_.settings.put_bool(kHeartbeatLostKey, true); !st)
    spdlog::error("Failed to persist {}: {}", kHeartbeatLostKey, st.msg);

  d_.events.emit(services::Event{
    .name = "heartbeat lost",
    .fields = {{"serial", b.serial()}},
    .objects = {{"deviceState", board::health_fields(h)}},
  });
}

core::Result<services::ExitStatus> Supervisor::run_once() {
  using R = core::Result<services::ExitStatus>;

  auto dr = discover_boards(d_.driver, d_.firmware, d_.sleep, cfg_);
  if (!dr) return R::Fail(std::move(dr.st));
  auto boards = std::move(dr.value);

  for (auto& b : boards) {
    auto hr = b->health();
    if (!hr) return R::Fail(std::move(hr.st));
    check_heartbeat_(*b, hr.value);

    spdlog::info("Resetting board {}", b->serial());
    if (auto st = b->reset(); !st) return R::Fail(std::move(st));
  }

  order_boards(boards);
  const auto serials = serials_of(boards);

  // The daemon opens the boards itself.
  for (auto& b : boards) b->close();
  boards.clear();

  auto lr = d_.daemon.launch(serials);
  if (!lr) return R::Fail(std::move(lr.st));

  if (!lr.value.ok())
    spdlog::error("Board daemon stopped: {}", lr.value.describe());
  else
    spdlog::info("Board daemon stopped: {}", lr.value.describe());

  return lr;
}

core::Status Supervisor::run_forever() {
  for (;;) {
    auto r = run_once();
    if (!r) return r.st;
  }
}

} // namespace pandad::bringup
