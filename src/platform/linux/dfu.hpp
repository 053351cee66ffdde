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
#include "platform/linux/sysfs_usb.hpp"
#include "platform/linux/usbfs_device.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pandad::linux {

// STM32 ROM bootloader (DfuSe).
inline constexpr std::uint16_t kDfuVid = 0x0483;
inline constexpr std::uint16_t kDfuPid = 0xdf11;

inline constexpr std::uint32_t kFlashBase = 0x08000000;

inline EnumerateFilter dfu_filter() { return {.vendor = kDfuVid, .products = {kDfuPid}}; }

board::McuType dfu_mcu_type(std::uint16_t bcd_device) noexcept;

// The ROM bootloader reports a serial derived from the 96-bit chip UID the
// firmware reports; this maps one to the other. Fails on malformed input or
// a UID whose sums do not fit 16 bits.
std::optional<std::string> dfu_serial_for(std::string_view st_serial, board::McuType mcu);

std::filesystem::path bootstub_image(const std::filesystem::path& firmware_dir, board::McuType mcu);

class UsbDfuBoard final : public board::IDfuBoard {
 public:
  UsbDfuBoard(UsbDeviceSysfsInfo info, std::filesystem::path firmware_dir);

  core::Status open() noexcept;

  const std::string& serial() const noexcept override { return info_.serial; }

  // Programs the bootstub and leaves DFU; the board comes back in bootstub.
  core::Status recover() override;
  void close() noexcept override { dev_.close(); }

 private:
  core::Result<std::vector<std::uint8_t>> get_status_();
  core::Status clear_status_();
  core::Status wait_idle_();
  core::Status erase_(std::uint32_t address);
  core::Status program_(std::uint32_t address, std::span<const std::uint8_t> data, std::size_t block_size);
  core::Status leave_();

  UsbDeviceSysfsInfo info_;
  std::filesystem::path firmware_dir_;
  board::McuType mcu_;
  UsbFsDevice dev_;
};

} // namespace pandad::linux
