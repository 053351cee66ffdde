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
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pandad::linux {

struct UsbDeviceSysfsInfo {
  std::string sysname;
  std::string serial;
  int busnum = -1;
  int devnum = -1;
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::uint16_t bcd_device = 0;

  std::string devnode() const;
};

struct EnumerateFilter {
  std::uint16_t vendor = 0;
  std::vector<std::uint16_t> products;
};

inline constexpr std::string_view kSysUsbDevices = "/sys/bus/usb/devices";

// Matches are sorted by serial so repeated scans list boards in the same order.
std::vector<UsbDeviceSysfsInfo>
enumerate_usb_devices_sysfs(const EnumerateFilter &filter,
                            const std::filesystem::path &root = kSysUsbDevices);

std::optional<UsbDeviceSysfsInfo>
find_by_serial(const EnumerateFilter &filter, std::string_view serial,
               const std::filesystem::path &root = kSysUsbDevices);

} // namespace pandad::linux
