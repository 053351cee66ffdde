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

#include "board/types.hpp"

#include <filesystem>

namespace pandad::board {

struct FirmwarePaths {
  std::filesystem::path default_image;
  std::filesystem::path h7_image;

  const std::filesystem::path& image_for(McuType mcu) const noexcept {
    return mcu == McuType::H7 ? h7_image : default_image;
  }
};

inline FirmwarePaths default_firmware_paths(const std::filesystem::path& firmware_dir) {
  return FirmwarePaths{.default_image = firmware_dir / "panda.bin.signed",
                       .h7_image = firmware_dir / "panda_h7.bin.signed"};
}

} // namespace pandad::board
