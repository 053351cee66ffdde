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
#include "core/status.hpp"

#include <string_view>
#include <vector>

namespace pandad::bringup {

enum class FlashState {
  Unverified,
  SignatureMismatchOrBootstub,
  Flashed,
  BootstubAfterFlash,
  Recovered,
  VerifiedOk,
  Fatal,
};

std::string_view to_string(FlashState s) noexcept;

struct FlashOutcome {
  FlashState state = FlashState::Unverified;
  std::vector<FlashState> trail;

  // Set when state == Fatal.
  core::Status st;

  bool ok() const noexcept { return state == FlashState::VerifiedOk; }
};

/*
 * Single pass per discovery cycle:
 *   verify -> flash if bootstub or signature differs -> recover if still in
 *   bootstub -> fatal if still in bootstub -> re-verify -> fatal on mismatch.
 * Nothing is retried here. Any driver error ends the pass as Fatal with the
 * driver's Transport status.
 */
FlashOutcome flash_board(board::IBoard& b, const board::Signature& expected);

} // namespace pandad::bringup
