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

#include "platform/linux/dfu.hpp"

#include "core/endian.hpp"
#include "core/file.hpp"
#include "core/str.hpp"

#include <array>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pandad::linux {

namespace {

constexpr std::uint8_t kDfuRequestType = 0x21; // class, interface

constexpr std::uint8_t DFU_DNLOAD = 1;
constexpr std::uint8_t DFU_GETSTATUS = 3;
constexpr std::uint8_t DFU_CLRSTATUS = 4;
constexpr std::uint8_t DFU_ABORT = 6;

constexpr std::uint8_t kCmdSetAddress = 0x21;
constexpr std::uint8_t kCmdErase = 0x41;

constexpr std::uint8_t kStateDnloadIdle = 0x05;
constexpr std::uint8_t kStateError = 0x0a;

constexpr std::size_t kBootstubBlock = 2048;
constexpr int kMaxStatusPolls = 1000;

std::array<std::uint8_t, 5> dfuse_cmd(std::uint8_t cmd, std::uint32_t address) {
  std::array<std::uint8_t, 5> out{};
  out[0] = cmd;
  core::store_le<std::uint32_t>(out, 1, address);
  return out;
}

std::uint32_t app_start(board::McuType mcu) noexcept {
  return mcu == board::McuType::H7 ? kFlashBase + 0x20000 : kFlashBase + 0x4000;
}

} // namespace

board::McuType dfu_mcu_type(std::uint16_t bcd_device) noexcept {
  return bcd_device == 0x0200 ? board::McuType::H7 : board::McuType::F4;
}

std::optional<std::string> dfu_serial_for(std::string_view st_serial, board::McuType mcu) {
  std::string raw;
  if (st_serial.size() != 24 || !core::from_hex(st_serial, raw)) return std::nullopt;

  const auto bytes = std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size());
  std::uint16_t uid[6];
  for (std::size_t i = 0; i < 6; ++i) uid[i] = core::load_le<std::uint16_t>(bytes, i * 2);

  const std::uint32_t adj = mcu == board::McuType::H7 ? 0 : 0xA;
  const std::uint32_t hi = std::uint32_t{uid[1]} + uid[5];
  const std::uint32_t mid = std::uint32_t{uid[0]} + uid[4] + adj;
  // Each part is a 16-bit field; a UID that overflows one has no DFU serial.
  if (hi > 0xffff || mid > 0xffff) return std::nullopt;
  return fmt::format("{:04X}{:04X}{:04X}", hi, mid, uid[3]);
}

std::filesystem::path bootstub_image(const std::filesystem::path& firmware_dir, board::McuType mcu) {
  return firmware_dir / (mcu == board::McuType::H7 ? "bootstub.panda_h7.bin" : "bootstub.panda.bin");
}

UsbDfuBoard::UsbDfuBoard(UsbDeviceSysfsInfo info, std::filesystem::path firmware_dir)
  : info_(std::move(info)),
    firmware_dir_(std::move(firmware_dir)),
    mcu_(dfu_mcu_type(info_.bcd_device)),
    dev_(info_.devnode()) {}

core::Status UsbDfuBoard::open() noexcept {
  return dev_.open_and_init(0);
}

core::Result<std::vector<std::uint8_t>> UsbDfuBoard::get_status_() {
  auto r = dev_.control_in({.request_type = kDfuRequestType, .request = DFU_GETSTATUS}, 6);
  if (r && r.value.size() < 6)
    return core::Result<std::vector<std::uint8_t>>::Failf(core::ErrorKind::Transport,
                                                          "DFU {}: short status ({} bytes)", info_.serial, r.value.size());
  return r;
}

core::Status UsbDfuBoard::clear_status_() {
  auto sr = get_status_();
  if (!sr) return sr.st;

  const std::uint8_t state = sr.value[4];
  if (state == kStateError) {
    PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType, .request = DFU_CLRSTATUS}));
  } else if (state == kStateDnloadIdle) {
    PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType, .request = DFU_ABORT}));
    PANDAD_TRY(wait_idle_());
  }
  return get_status_().st;
}

// bwPollTimeout drops to zero once the previous command has completed.
core::Status UsbDfuBoard::wait_idle_() {
  for (int i = 0; i < kMaxStatusPolls; ++i) {
    auto sr = get_status_();
    if (!sr) return sr.st;
    if (sr.value[1] == 0) return core::Status::Ok();
  }
  return core::Status::Failf(core::ErrorKind::Transport, "DFU {}: device stayed busy", info_.serial);
}

core::Status UsbDfuBoard::erase_(std::uint32_t address) {
  spdlog::debug("DFU {}: erase 0x{:08x}", info_.serial, address);
  const auto cmd = dfuse_cmd(kCmdErase, address);
  PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType, .request = DFU_DNLOAD}, cmd));
  return wait_idle_();
}

core::Status UsbDfuBoard::program_(std::uint32_t address, std::span<const std::uint8_t> data, std::size_t block_size) {
  const auto cmd = dfuse_cmd(kCmdSetAddress, address);
  PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType, .request = DFU_DNLOAD}, cmd));
  PANDAD_TRY(wait_idle_());

  std::vector<std::uint8_t> padded(data.begin(), data.end());
  if (const auto rem = padded.size() % block_size) padded.resize(padded.size() + (block_size - rem), 0xFF);

  const std::size_t blocks = padded.size() / block_size;
  for (std::size_t i = 0; i < blocks; ++i) {
    spdlog::debug("DFU {}: programming block {} of {}", info_.serial, i + 1, blocks);
    const auto chunk = std::span<const std::uint8_t>(padded).subspan(i * block_size, block_size);
    PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType,
                                 .request = DFU_DNLOAD,
                                 .value = static_cast<std::uint16_t>(2 + i)},
                                chunk));
    PANDAD_TRY(wait_idle_());
  }
  return core::Status::Ok();
}

core::Status UsbDfuBoard::leave_() {
  const auto cmd = dfuse_cmd(kCmdSetAddress, kFlashBase);
  PANDAD_TRY(dev_.control_out({.request_type = kDfuRequestType, .request = DFU_DNLOAD}, cmd));
  PANDAD_TRY(wait_idle_());

  // Zero-length download with the manifest bit set; the chip resets.
  PANDAD_TRY(dev_.control_out_expect_disconnect({.request_type = kDfuRequestType, .request = DFU_DNLOAD, .value = 2}));
  if (auto sr = get_status_(); !sr) spdlog::debug("DFU {}: gone after leave ({})", info_.serial, sr.st.msg);
  return core::Status::Ok();
}

core::Status UsbDfuBoard::recover() {
  const auto image = bootstub_image(firmware_dir_, mcu_);
  auto code = core::File::read_all(image);
  if (!code) return code.st;

  spdlog::info("DFU {}: programming bootstub {} ({} MCU, {} bytes)",
               info_.serial, image.string(), board::to_string(mcu_), code.value.size());

  PANDAD_TRY(clear_status_());
  PANDAD_TRY(erase_(kFlashBase));
  PANDAD_TRY(erase_(app_start(mcu_)));
  PANDAD_TRY(program_(kFlashBase, code.value, kBootstubBlock));
  return leave_();
}

} // namespace pandad::linux
