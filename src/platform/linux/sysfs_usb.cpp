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

#include "platform/linux/sysfs_usb.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pandad::linux {

namespace fs = std::filesystem;

namespace {

// First line of a sysfs attribute, trimmed; nullopt when the attribute is absent.
std::optional<std::string> read_attr(const fs::path &dir, const char *name) {
  std::ifstream in(dir / name);
  if (!in.is_open())
    return std::nullopt;
  std::string s;
  std::getline(in, s);
  return std::string(core::trim_ws(s));
}

template <class T>
std::optional<T> parse_uint(const std::optional<std::string> &attr, int base) {
  if (!attr)
    return std::nullopt;
  const std::string_view s = *attr;

  T v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return v;
}

// Interfaces and hubs' ports also live under the devices root; only
// entries carrying the device-level attributes are USB devices.
std::optional<UsbDeviceSysfsInfo> load_device(const fs::path &dir) {
  const auto vend = parse_uint<std::uint16_t>(read_attr(dir, "idVendor"), 16);
  const auto prod = parse_uint<std::uint16_t>(read_attr(dir, "idProduct"), 16);
  const auto bus = parse_uint<int>(read_attr(dir, "busnum"), 10);
  const auto dev = parse_uint<int>(read_attr(dir, "devnum"), 10);
  if (!vend || !prod || !bus || !dev)
    return std::nullopt;

  UsbDeviceSysfsInfo out;
  out.sysname = dir.filename().string();
  out.vendor = *vend;
  out.product = *prod;
  out.busnum = *bus;
  out.devnum = *dev;
  out.serial = read_attr(dir, "serial").value_or("");
  out.bcd_device = parse_uint<std::uint16_t>(read_attr(dir, "bcdDevice"), 16).value_or(0);
  return out;
}

bool matches(const UsbDeviceSysfsInfo &d, const EnumerateFilter &filter) {
  if (d.vendor != filter.vendor)
    return false;
  return filter.products.empty() || std::ranges::find(filter.products, d.product) != filter.products.end();
}

} // namespace

std::string UsbDeviceSysfsInfo::devnode() const {
  return fmt::format("/dev/bus/usb/{:03}/{:03}", busnum, devnum);
}

std::vector<UsbDeviceSysfsInfo>
enumerate_usb_devices_sysfs(const EnumerateFilter &filter, const fs::path &root) {
  std::vector<UsbDeviceSysfsInfo> out;

  std::error_code ec;
  if (!fs::is_directory(root, ec))
    return out;

  for (const auto &entry : fs::directory_iterator(root, ec)) {
    if (!entry.is_directory(ec))
      continue;

    auto info = load_device(entry.path());
    if (!info || !matches(*info, filter))
      continue;

    spdlog::debug("Matched USB device: {} (VID: 0x{:04x}, PID: 0x{:04x}, serial: {})",
                  info->sysname, info->vendor, info->product, info->serial);
    out.push_back(std::move(*info));
  }

  std::ranges::sort(out, {}, &UsbDeviceSysfsInfo::serial);

  return out;
}

std::optional<UsbDeviceSysfsInfo>
find_by_serial(const EnumerateFilter &filter, std::string_view serial, const fs::path &root) {
  for (auto &d : enumerate_usb_devices_sysfs(filter, root))
    if (d.serial == serial)
      return std::move(d);
  return std::nullopt;
}

} // namespace pandad::linux
