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

#include "board/firmware_paths.hpp"
#include "board/types.hpp"
#include "core/status.hpp"

#include <cstddef>
#include <filesystem>
#include <utility>

namespace pandad::bringup {

// Signed images carry their signature in the trailing bytes.
inline constexpr std::size_t kSignatureSize = 128;

core::Result<board::Signature> signature_from_firmware(const std::filesystem::path& image) noexcept;

class FirmwareResolver {
 public:
  explicit FirmwareResolver(board::FirmwarePaths paths) : paths_(std::move(paths)) {}

  const std::filesystem::path& image_for(board::McuType mcu) const noexcept;

  // Never fails: an unreadable image yields an empty signature, which no
  // running firmware reports, so the board gets flashed.
  board::Signature expected_signature(board::McuType mcu) const;

 private:
  board::FirmwarePaths paths_;
};

} // namespace pandad::bringup
