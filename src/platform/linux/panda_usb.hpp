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
#include "core/retry.hpp"
#include "core/status.hpp"
#include "platform/linux/sysfs_usb.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pandad::linux {

inline constexpr std::uint16_t kBoardVid = 0xbbaa;
inline constexpr std::uint16_t kBoardPid = 0xddcc;
inline constexpr std::uint16_t kBootstubPid = 0xddee;

inline EnumerateFilter board_filter() { return {.vendor = kBoardVid, .products = {kBoardPid, kBootstubPid}}; }

struct DriverCfg {
  std::filesystem::path firmware_dir;
  std::filesystem::path sysfs_root{kSysUsbDevices};

  // Waiting for a board to come back after it reboots.
  std::chrono::milliseconds reconnect_interval{1000};
  std::size_t reconnect_attempts = 15;

  core::Sleeper sleep = core::real_sleeper();
};

// Highest flash sector the application image reaches, or failure if the
// image would run into the sectors reserved past the application area.
core::Result<int> last_app_sector(board::McuType mcu, std::size_t image_size);

class UsbBoardDriver final : public board::IBoardDriver {
 public:
  explicit UsbBoardDriver(DriverCfg cfg) : cfg_(std::move(cfg)) {}

  std::vector<std::string> list() override;
  std::vector<std::string> list_dfu() override;

  core::Result<std::unique_ptr<board::IBoard>> open(const std::string& serial) override;
  core::Result<std::unique_ptr<board::IDfuBoard>> open_dfu(const std::string& dfu_serial) override;

 private:
  DriverCfg cfg_;
};

} // namespace pandad::linux
