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

#include "bringup/ordering.hpp"

#include <algorithm>

namespace pandad::bringup {

SortKey sort_key(board::HwType type, std::string_view serial) {
  return SortKey{.external = !board::is_internal(type),
                 .hw_type = static_cast<std::uint8_t>(type),
                 .serial = std::string(serial)};
}

SortKey sort_key(const board::IBoard& b) { return sort_key(b.type(), b.serial()); }

void order_boards(std::vector<std::unique_ptr<board::IBoard>>& boards) {
  std::ranges::stable_sort(boards, [](const auto& a, const auto& b) { return sort_key(*a) < sort_key(*b); });
}

std::vector<std::string> serials_of(const std::vector<std::unique_ptr<board::IBoard>>& boards) {
  std::vector<std::string> out;
  out.reserve(boards.size());
  for (const auto& b : boards) out.push_back(b->serial());
  return out;
}

} // namespace pandad::bringup
