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

#include "bringup/discovery.hpp"

#include "bringup/flash_fsm.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace pandad::bringup {

namespace {

core::Status recover_dfu_boards(board::IBoardDriver& drv, const core::Sleeper& sleep, const DiscoveryCfg& cfg) {
  for (const auto& dfu_serial : drv.list_dfu()) {
    spdlog::info("Board in DFU mode found, flashing recovery {}", dfu_serial);

    auto dr = drv.open_dfu(dfu_serial);
    if (!dr) return dr.st;

    auto st = dr.value->recover();
    dr.value->close();
    if (!st) return st;

    sleep(cfg.dfu_settle);
  }
  return core::Status::Ok();
}

} // namespace

core::Result<BoardList> discover_boards(board::IBoardDriver& drv,
                                        const FirmwareResolver& fw,
                                        const core::Sleeper& sleep,
                                        const DiscoveryCfg& cfg) {
  spdlog::info("Connecting to board");

  if (auto st = recover_dfu_boards(drv, sleep, cfg); !st) return core::Result<BoardList>::Fail(std::move(st));

  const auto serials = core::poll_until([&] { return drv.list(); }, cfg.poll_interval, sleep);
  spdlog::info("{} board(s) found, connecting - {}", serials.size(), fmt::join(serials, ", "));

  BoardList out;
  out.reserve(serials.size());

  for (const auto& serial : serials) {
    auto br = drv.open(serial);
    if (!br) return core::Result<BoardList>::Fail(std::move(br.st));

    auto& b = *br.value;
    const auto expected = fw.expected_signature(b.mcu_type());

    auto outcome = flash_board(b, expected);
    if (!outcome.ok()) {
      spdlog::error("Bring-up of board {} failed: {}", serial, outcome.st.msg);
      return core::Result<BoardList>::Fail(std::move(outcome.st));
    }
    out.push_back(std::move(br.value));
  }

  return core::Result<BoardList>::Ok(std::move(out));
}

} // namespace pandad::bringup
