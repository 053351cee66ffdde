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

#include "core/status.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pandad::linux {

struct UsbIds {
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
};

struct ControlSetup {
  std::uint8_t request_type = 0;
  std::uint8_t request = 0;
  std::uint16_t value = 0;
  std::uint16_t index = 0;
};

class UsbFsDevice {
 public:
  explicit UsbFsDevice(std::string devnode);
  ~UsbFsDevice();

  UsbFsDevice(const UsbFsDevice&) = delete;
  UsbFsDevice& operator=(const UsbFsDevice&) = delete;

  UsbFsDevice(UsbFsDevice&&) noexcept;
  UsbFsDevice& operator=(UsbFsDevice&&) noexcept;

  core::Status open_and_init(int interface_number = 0) noexcept;

  void close() noexcept;

  UsbIds ids() const noexcept { return ids_; }
  const std::string& devnode() const noexcept { return devnode_; }

  core::Result<std::vector<std::uint8_t>> control_in(ControlSetup s, std::uint16_t length) noexcept;
  core::Status control_out(ControlSetup s, std::span<const std::uint8_t> data = {}) noexcept;

  // For requests that make the device drop off the bus: a transfer error
  // caused by the disconnect counts as success.
  core::Status control_out_expect_disconnect(ControlSetup s) noexcept;

  core::Status bulk_out(std::uint8_t ep, std::span<const std::uint8_t> data) noexcept;

 private:
  core::Status parse_descriptors_() noexcept;
  int control_out_raw_(ControlSetup s, std::span<const std::uint8_t> data) noexcept;

  bool kernel_driver_active_() const noexcept;
  bool detach_kernel_driver_() noexcept;
  bool attach_kernel_driver_() noexcept;

 private:
  std::string devnode_;
  FileHandle fd_;

  bool claimed_ = false;
  bool driver_detached_ = false;

  UsbIds ids_{};
  int ifc_num_ = -1;
  unsigned timeout_ms_ = 5000;
};

} // namespace pandad::linux
