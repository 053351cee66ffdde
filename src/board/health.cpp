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

#include "board/health.hpp"

#include "core/endian.hpp"

#include <fmt/format.h>

namespace pandad::board {

core::Result<HealthRecord> parse_health(std::span<const std::uint8_t> buf) noexcept {
  if (buf.size() < kHealthWireSize)
    return core::Result<HealthRecord>::Failf(core::ErrorKind::Transport,
                                             "Health response too short: {} bytes (need {})",
                                             buf.size(), kHealthWireSize);

  HealthRecord h;
  std::size_t off = 0;
  auto u32 = [&] {
    const auto v = core::load_le<std::uint32_t>(buf, off);
    off += 4;
    return v;
  };
  auto u16 = [&] {
    const auto v = core::load_le<std::uint16_t>(buf, off);
    off += 2;
    return v;
  };
  auto u8 = [&] { return buf[off++]; };

  h.uptime = u32();
  h.voltage = u32();
  h.current = u32();
  h.can_rx_errs = u32();
  h.can_send_errs = u32();
  h.can_fwd_errs = u32();
  h.gmlan_send_errs = u32();
  h.faults = u32();

  h.ignition_line = u8();
  h.ignition_can = u8();
  h.controls_allowed = u8();
  h.gas_interceptor_detected = u8();
  h.car_harness_status = u8();
  h.usb_power_mode = u8();
  h.safety_mode = u8();
  h.safety_param = u16();
  h.fault_status = u8();
  h.power_save_enabled = u8();
  h.heartbeat_lost = u8() != 0;

  return core::Result<HealthRecord>::Ok(h);
}

std::vector<std::pair<std::string, std::string>> health_fields(const HealthRecord& h) {
  auto n = [](auto v) { return fmt::format("{}", static_cast<unsigned long long>(v)); };
  return {
    {"uptime", n(h.uptime)},
    {"voltage", n(h.voltage)},
    {"current", n(h.current)},
    {"can_rx_errs", n(h.can_rx_errs)},
    {"can_send_errs", n(h.can_send_errs)},
    {"can_fwd_errs", n(h.can_fwd_errs)},
    {"gmlan_send_errs", n(h.gmlan_send_errs)},
    {"faults", n(h.faults)},
    {"ignition_line", n(h.ignition_line)},
    {"ignition_can", n(h.ignition_can)},
    {"controls_allowed", n(h.controls_allowed)},
    {"gas_interceptor_detected", n(h.gas_interceptor_detected)},
    {"car_harness_status", n(h.car_harness_status)},
    {"usb_power_mode", n(h.usb_power_mode)},
    {"safety_mode", n(h.safety_mode)},
    {"safety_param", n(h.safety_param)},
    {"fault_status", n(h.fault_status)},
    {"power_save_enabled", n(h.power_save_enabled)},
    {"heartbeat_lost", h.heartbeat_lost ? "true" : "false"},
  };
}

} // namespace pandad::board
