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

#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pandad::bringup {

// Ascending order: internal boards first, then hardware type, then serial.
struct SortKey {
  bool external = false;
  std::uint8_t hw_type = 0;
  std::string serial;

  auto operator<=>(const SortKey&) const = default;
};

SortKey sort_key(board::HwType type, std::string_view serial);
SortKey sort_key(const board::IBoard& b);

void order_boards(std::vector<std::unique_ptr<board::IBoard>>& boards);

std::vector<std::string> serials_of(const std::vector<std::unique_ptr<board::IBoard>>& boards);

} // namespace pandad::bringup
