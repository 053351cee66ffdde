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

#include "platform/linux/panda_usb.hpp"

#include "board/firmware_paths.hpp"
#include "core/file.hpp"
#include "core/str.hpp"
#include "platform/linux/dfu.hpp"
#include "platform/linux/usbfs_device.hpp"

#include <algorithm>
#include <array>
#include <span>

#include <spdlog/spdlog.h>

namespace pandad::linux {

namespace {

// Vendor request, device recipient. The firmware uses the IN type for
// its write requests as well.
constexpr std::uint8_t kVendorReq = 0xc0;

constexpr std::uint8_t REQ_FLASHER_PROBE = 0xb0;
constexpr std::uint8_t REQ_FLASH_UNLOCK = 0xb1;
constexpr std::uint8_t REQ_FLASH_ERASE = 0xb2;
constexpr std::uint8_t REQ_HW_TYPE = 0xc1;
constexpr std::uint8_t REQ_ENTER_BOOT = 0xd1;
constexpr std::uint8_t REQ_HEALTH = 0xd2;
constexpr std::uint8_t REQ_SIGNATURE_LO = 0xd3;
constexpr std::uint8_t REQ_SIGNATURE_HI = 0xd4;
constexpr std::uint8_t REQ_VERSION = 0xd6;
constexpr std::uint8_t REQ_RESET = 0xd8;

constexpr std::uint16_t kBootModeBootstub = 1;
constexpr std::uint16_t kBootModeRom = 0;

constexpr std::uint8_t kFlashEp = 2;
constexpr std::size_t kFlashStep = 0x10;
constexpr std::uint16_t kSignatureHalf = 0x40;
constexpr std::array<std::uint8_t, 4> kFlasherMagic = {0xde, 0xad, 0xd0, 0x0d};

constexpr int kMaxAppSector = 7;

std::vector<std::size_t> sector_sizes(board::McuType mcu) {
  if (mcu == board::McuType::H7) return std::vector<std::size_t>(8, 0x20000);
  return {0x4000, 0x4000, 0x4000, 0x4000, 0x10000, 0x20000, 0x20000, 0x20000, 0x20000, 0x20000, 0x20000, 0x20000};
}

std::vector<std::string> serials(const std::vector<UsbDeviceSysfsInfo>& devs) {
  std::vector<std::string> out;
  out.reserve(devs.size());
  for (const auto& d : devs) {
    if (d.serial.empty()) continue;
    out.push_back(d.serial);
  }
  return out;
}

class UsbBoard final : public board::IBoard {
 public:
  UsbBoard(std::string serial, DriverCfg cfg) : serial_(std::move(serial)), cfg_(std::move(cfg)) {}
  ~UsbBoard() override { close(); }

  core::Status connect();

  const std::string& serial() const noexcept override { return serial_; }
  board::HwType type() const noexcept override { return type_; }
  board::McuType mcu_type() const noexcept override { return mcu_; }
  bool bootstub() const noexcept override { return bootstub_; }

  core::Result<std::string> version() override;
  core::Result<board::Signature> signature() override;

  core::Status flash() override;
  core::Status recover() override;
  core::Status reset() override;
  core::Result<board::HealthRecord> health() override;

  void close() noexcept override {
    if (dev_) dev_->close();
    dev_.reset();
  }

 private:
  core::Result<std::vector<std::uint8_t>> read_(std::uint8_t request, std::uint16_t length);
  core::Status command_(std::uint8_t request, std::uint16_t value = 0);
  core::Status reboot_(std::uint8_t request, std::uint16_t value = 0);
  core::Status reconnect_();
  core::Status flash_image_(std::span<const std::uint8_t> code);
  core::Status wait_for_dfu_(const std::string& dfu_serial, UsbDeviceSysfsInfo& out);

  std::string serial_;
  DriverCfg cfg_;
  std::unique_ptr<UsbFsDevice> dev_;

  board::HwType type_ = board::HwType::Unknown;
  board::McuType mcu_ = board::McuType::Unknown;
  bool bootstub_ = false;
};

core::Status UsbBoard::connect() {
  close();

  const auto info = find_by_serial(board_filter(), serial_, cfg_.sysfs_root);
  if (!info) return core::Status::Failf(core::ErrorKind::Transport, "Board {} not found", serial_);

  auto dev = std::make_unique<UsbFsDevice>(info->devnode());
  PANDAD_TRY(dev->open_and_init(0));
  if (dev->ids().vendor != kBoardVid)
    return core::Status::Failf(core::ErrorKind::Transport, "{} is not a board (vendor 0x{:04x})", dev->devnode(), dev->ids().vendor);
  dev_ = std::move(dev);
  bootstub_ = dev_->ids().product == kBootstubPid;

  auto hw = read_(REQ_HW_TYPE, 0x40);
  if (!hw) return hw.st;
  if (hw.value.empty()) return core::Status::Failf(core::ErrorKind::Transport, "Board {}: empty hardware type reply", serial_);

  type_ = static_cast<board::HwType>(hw.value[0]);
  mcu_ = board::mcu_for(type_);

  spdlog::debug("Board {} on {}: {} ({}), bootstub={}", serial_, dev_->devnode(), board::to_string(type_),
                board::to_string(mcu_), bootstub_);
  return core::Status::Ok();
}

core::Result<std::vector<std::uint8_t>> UsbBoard::read_(std::uint8_t request, std::uint16_t length) {
  if (!dev_) return core::Result<std::vector<std::uint8_t>>::Failf(core::ErrorKind::Transport, "Board {} is not open", serial_);
  return dev_->control_in({.request_type = kVendorReq, .request = request}, length);
}

core::Status UsbBoard::command_(std::uint8_t request, std::uint16_t value) {
  if (!dev_) return core::Status::Failf(core::ErrorKind::Transport, "Board {} is not open", serial_);
  return dev_->control_out({.request_type = kVendorReq, .request = request, .value = value});
}

core::Status UsbBoard::reboot_(std::uint8_t request, std::uint16_t value) {
  if (!dev_) return core::Status::Failf(core::ErrorKind::Transport, "Board {} is not open", serial_);
  return dev_->control_out_expect_disconnect({.request_type = kVendorReq, .request = request, .value = value});
}

core::Status UsbBoard::reconnect_() {
  close();
  core::Status last = core::Status::Failf(core::ErrorKind::Transport, "Board {} did not come back", serial_);
  for (std::size_t i = 0; i < cfg_.reconnect_attempts; ++i) {
    cfg_.sleep(cfg_.reconnect_interval);
    auto st = connect();
    if (st) return st;
    spdlog::debug("Reconnect {}/{} to {}: {}", i + 1, cfg_.reconnect_attempts, serial_, st.msg);
    last = std::move(st);
  }
  return core::Status::Failf(core::ErrorKind::Transport, "Board {} did not come back: {}", serial_, last.msg);
}

core::Result<std::string> UsbBoard::version() {
  auto r = read_(REQ_VERSION, 0x40);
  if (!r) return core::Result<std::string>::Fail(std::move(r.st));

  std::string_view sv(reinterpret_cast<const char*>(r.value.data()), r.value.size());
  if (const auto nul = sv.find('\0'); nul != std::string_view::npos) sv = sv.substr(0, nul);
  return core::Result<std::string>::Ok(std::string(core::trim_ws(sv)));
}

core::Result<board::Signature> UsbBoard::signature() {
  auto lo = read_(REQ_SIGNATURE_LO, kSignatureHalf);
  if (!lo) return core::Result<board::Signature>::Fail(std::move(lo.st));
  auto hi = read_(REQ_SIGNATURE_HI, kSignatureHalf);
  if (!hi) return core::Result<board::Signature>::Fail(std::move(hi.st));

  board::Signature sig = std::move(lo.value);
  sig.insert(sig.end(), hi.value.begin(), hi.value.end());
  return core::Result<board::Signature>::Ok(std::move(sig));
}

core::Status UsbBoard::flash_image_(std::span<const std::uint8_t> code) {
  auto probe = read_(REQ_FLASHER_PROBE, 0xc);
  if (!probe) return probe.st;
  if (probe.value.size() < 8 || !std::equal(kFlasherMagic.begin(), kFlasherMagic.end(), probe.value.begin() + 4)) {
    return core::Status::Failf(core::ErrorKind::Transport, "Board {}: flasher not present", serial_);
  }

  auto last = last_app_sector(mcu_, code.size());
  if (!last) return last.st;

  PANDAD_TRY(command_(REQ_FLASH_UNLOCK));
  for (int i = 1; i <= last.value; ++i) {
    spdlog::debug("Board {}: erasing sector {}", serial_, i);
    PANDAD_TRY(command_(REQ_FLASH_ERASE, static_cast<std::uint16_t>(i)));
  }

  for (std::size_t off = 0; off < code.size(); off += kFlashStep) {
    const auto n = std::min(kFlashStep, code.size() - off);
    PANDAD_TRY(dev_->bulk_out(kFlashEp, code.subspan(off, n)));
  }

  return reboot_(REQ_RESET);
}

core::Status UsbBoard::flash() {
  const auto image = board::default_firmware_paths(cfg_.firmware_dir).image_for(mcu_);
  spdlog::info("Flashing {} with {}", serial_, image.string());

  auto code = core::File::read_all(image);
  if (!code) return code.st;

  if (!bootstub_) {
    PANDAD_TRY(reboot_(REQ_ENTER_BOOT, kBootModeBootstub));
    PANDAD_TRY(reconnect_());
    if (!bootstub_) return core::Status::Failf(core::ErrorKind::Transport, "Board {} did not enter the bootstub", serial_);
  }

  PANDAD_TRY(flash_image_(code.value));
  return reconnect_();
}

core::Status UsbBoard::wait_for_dfu_(const std::string& dfu_serial, UsbDeviceSysfsInfo& out) {
  auto found = core::poll_until(
    [&] {
      std::vector<UsbDeviceSysfsInfo> v;
      if (auto d = find_by_serial(dfu_filter(), dfu_serial, cfg_.sysfs_root)) v.push_back(std::move(*d));
      return v;
    },
    cfg_.reconnect_interval, cfg_.sleep, cfg_.reconnect_attempts);
  if (found.empty()) return core::Status::Failf(core::ErrorKind::Transport, "DFU device {} did not appear", dfu_serial);
  out = std::move(found.front());
  return core::Status::Ok();
}

core::Status UsbBoard::recover() {
  const auto dfu_serial = dfu_serial_for(serial_, mcu_);
  if (!dfu_serial) return core::Status::Failf(core::ErrorKind::Transport, "Cannot derive DFU serial from {}", serial_);

  spdlog::info("Recovering {} through DFU ({})", serial_, *dfu_serial);
  if (!bootstub_) {
    PANDAD_TRY(reboot_(REQ_ENTER_BOOT, kBootModeBootstub));
    PANDAD_TRY(reconnect_());
  }
  PANDAD_TRY(reboot_(REQ_ENTER_BOOT, kBootModeRom));
  close();

  UsbDeviceSysfsInfo info;
  PANDAD_TRY(wait_for_dfu_(*dfu_serial, info));

  UsbDfuBoard dfu(std::move(info), cfg_.firmware_dir);
  PANDAD_TRY(dfu.open());
  auto st = dfu.recover();
  dfu.close();
  PANDAD_TRY(st);

  PANDAD_TRY(reconnect_());
  return flash();
}

core::Status UsbBoard::reset() {
  PANDAD_TRY(reboot_(REQ_RESET));
  return reconnect_();
}

core::Result<board::HealthRecord> UsbBoard::health() {
  auto r = read_(REQ_HEALTH, static_cast<std::uint16_t>(board::kHealthWireSize));
  if (!r) return core::Result<board::HealthRecord>::Fail(std::move(r.st));
  return board::parse_health(r.value);
}

} // namespace

core::Result<int> last_app_sector(board::McuType mcu, std::size_t image_size) {
  const auto sizes = sector_sizes(mcu);
  std::size_t end = 0;
  int last = -1;
  for (std::size_t i = 1; i < sizes.size(); ++i) {
    end += sizes[i];
    if (end > image_size) {
      last = static_cast<int>(i);
      break;
    }
  }
  if (last < 1 || last >= kMaxAppSector) {
    return core::Result<int>::Failf(core::ErrorKind::Transport, "Binary too large ({} bytes)", image_size);
  }
  return core::Result<int>::Ok(last);
}

std::vector<std::string> UsbBoardDriver::list() {
  return serials(enumerate_usb_devices_sysfs(board_filter(), cfg_.sysfs_root));
}

std::vector<std::string> UsbBoardDriver::list_dfu() {
  return serials(enumerate_usb_devices_sysfs(dfu_filter(), cfg_.sysfs_root));
}

core::Result<std::unique_ptr<board::IBoard>> UsbBoardDriver::open(const std::string& serial) {
  auto b = std::make_unique<UsbBoard>(serial, cfg_);
  if (auto st = b->connect(); !st) return core::Result<std::unique_ptr<board::IBoard>>::Fail(std::move(st));
  return core::Result<std::unique_ptr<board::IBoard>>::Ok(std::move(b));
}

core::Result<std::unique_ptr<board::IDfuBoard>> UsbBoardDriver::open_dfu(const std::string& dfu_serial) {
  auto info = find_by_serial(dfu_filter(), dfu_serial, cfg_.sysfs_root);
  if (!info) return core::Result<std::unique_ptr<board::IDfuBoard>>::Failf(core::ErrorKind::Transport, "DFU device {} not found", dfu_serial);

  auto d = std::make_unique<UsbDfuBoard>(std::move(*info), cfg_.firmware_dir);
  if (auto st = d->open(); !st) return core::Result<std::unique_ptr<board::IDfuBoard>>::Fail(std::move(st));
  return core::Result<std::unique_ptr<board::IDfuBoard>>::Ok(std::move(d));
}

} // namespace pandad::linux
