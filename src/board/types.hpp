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

#include <cstdint>
#include <string_view>
#include <vector>

namespace pandad::board {

// Values match what the firmware reports for the hardware type request.
enum class HwType : std::uint8_t {
  Unknown = 0,
  WhitePanda = 1,
  GreyPanda = 2,
  BlackPanda = 3,
  Pedal = 4,
  Uno = 5,
  Dos = 6,
  RedPanda = 7,
};

enum class McuType : std::uint8_t { Unknown, F2, F4, H7 };

using Signature = std::vector<std::uint8_t>;

// Boards built into the host unit. These always lead the daemon's argument list.
constexpr bool is_internal(HwType t) noexcept {
  return t == HwType::Uno || t == HwType::Dos;
}

constexpr McuType mcu_for(HwType t) noexcept {
  switch (t) {
    case HwType::Pedal: return McuType::F2;
    case HwType::RedPanda: return McuType::H7;
    case HwType::Unknown: return McuType::Unknown;
    default: return McuType::F4;
  }
}

constexpr std::string_view to_string(HwType t) noexcept {
  switch (t) {
    case HwType::Unknown: return "unknown";
    case HwType::WhitePanda: return "white";
    case HwType::GreyPanda: return "grey";
    case HwType::BlackPanda: return "black";
    case HwType::Pedal: return "pedal";
    case HwType::Uno: return "uno";
    case HwType::Dos: return "dos";
    case HwType::RedPanda: return "red";
  }
  return "unknown";
}

constexpr std::string_view to_string(McuType m) noexcept {
  switch (m) {
    case McuType::Unknown: return "unknown";
    case McuType::F2: return "F2";
    case McuType::F4: return "F4";
    case McuType::H7: return "H7";
  }
  return "unknown";
}

} // namespace pandad::board
