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
#include "bringup/firmware.hpp"
#include "core/retry.hpp"
#include "core/status.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace pandad::bringup {

struct DiscoveryCfg {
  // Pause after each DFU recovery so the board can come back as a normal device.
  std::chrono::milliseconds dfu_settle{1000};
  std::chrono::milliseconds poll_interval{1000};
};

using BoardList = std::vector<std::unique_ptr<board::IBoard>>;

/*
 * Recovers every board stuck in DFU mode, then blocks until at least one
 * board enumerates normally and runs flash_board() on each, in enumeration
 * order. The first board that ends Fatal aborts the whole pass; handles
 * opened so far are released on return.
 */
core::Result<BoardList> discover_boards(board::IBoardDriver& drv,
                                        const FirmwareResolver& fw,
                                        const core::Sleeper& sleep,
                                        const DiscoveryCfg& cfg = {});

} // namespace pandad::bringup
