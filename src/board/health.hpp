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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace pandad::board {

struct HealthRecord {
  std::uint32_t uptime = 0;
  std::uint32_t voltage = 0;
  std::uint32_t current = 0;
  std::uint32_t can_rx_errs = 0;
  std::uint32_t can_send_errs = 0;
  std::uint32_t can_fwd_errs = 0;
  std::uint32_t gmlan_send_errs = 0;
  std::uint32_t faults = 0;

  std::uint8_t ignition_line = 0;
  std::uint8_t ignition_can = 0;
  std::uint8_t controls_allowed = 0;
  std::uint8_t gas_interceptor_detected = 0;
  std::uint8_t car_harness_status = 0;
  std::uint8_t usb_power_mode = 0;
  std::uint8_t safety_mode = 0;
  std::uint16_t safety_param = 0;
  std::uint8_t fault_status = 0;
  std::uint8_t power_save_enabled = 0;
  bool heartbeat_lost = false;
};

/*
 * Wire layout of the health response, little endian, packed:
 *   8 x u32  uptime voltage current can_rx_errs can_send_errs
 *            can_fwd_errs gmlan_send_errs faults
 *   7 x u8   ignition_line ignition_can controls_allowed
 *            gas_interceptor_detected car_harness_status usb_power_mode
 *            safety_mode
 *   1 x u16  safety_param
 *   3 x u8   fault_status power_save_enabled heartbeat_lost
 * Trailing bytes from newer firmware are ignored.
 */
inline constexpr std::size_t kHealthWireSize = 8 * 4 + 7 + 2 + 3;

core::Result<HealthRecord> parse_health(std::span<const std::uint8_t> buf) noexcept;

// Ordered name/value pairs, used when the record is attached to an event.
std::vector<std::pair<std::string, std::string>> health_fields(const HealthRecord& h);

} // namespace pandad::board
