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

#include "platform/linux/usbfs_device.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <linux/usb/ch9.h>
#include <linux/usbdevice_fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pandad::linux {

namespace {

core::Status errno_status(int e, std::string_view what, const std::string& devnode) {
  return core::Status::Failf(core::ErrorKind::Transport, "{} {}: {}", what, devnode, std::strerror(e));
}

bool is_disconnect_errno(int e) noexcept {
  return e == ENODEV || e == EPIPE || e == EPROTO || e == ESHUTDOWN || e == ETIMEDOUT;
}

} // namespace

UsbFsDevice::UsbFsDevice(std::string devnode) : devnode_(std::move(devnode)) {}
UsbFsDevice::~UsbFsDevice() { close(); }

UsbFsDevice::UsbFsDevice(UsbFsDevice&& o) noexcept { *this = std::move(o); }

UsbFsDevice& UsbFsDevice::operator=(UsbFsDevice&& o) noexcept {
    if (this == &o) return *this;
    close();

    devnode_ = std::move(o.devnode_);
    fd_ = std::move(o.fd_);

    claimed_ = o.claimed_; o.claimed_ = false;
    driver_detached_ = o.driver_detached_; o.driver_detached_ = false;

    ids_ = o.ids_;
    ifc_num_ = o.ifc_num_;
    timeout_ms_ = o.timeout_ms_;
    return *this;
}

core::Status UsbFsDevice::open_and_init(int interface_number) noexcept {
    close();

    fd_ = do_open(devnode_.c_str(), O_RDWR, 0);
    if (!fd_.valid()) return errno_status(errno, "open", devnode_);

    PANDAD_TRY(parse_descriptors_());

    ifc_num_ = interface_number;

    if (kernel_driver_active_()) {
        if (!detach_kernel_driver_()) {
            close();
            return core::Status::Failf(core::ErrorKind::Transport, "Cannot detach kernel driver: {}", devnode_);
        }
        driver_detached_ = true;
    }

    int ifc = ifc_num_;
    if (do_ioctl(fd_, USBDEVFS_CLAIMINTERFACE, &ifc) != 0) {
        auto st = errno_status(errno, "Cannot claim interface", devnode_);
        close();
        return st;
    }
    claimed_ = true;
    return core::Status::Ok();
}

void UsbFsDevice::close() noexcept {
    if (!fd_.valid()) return;

    if (claimed_) {
        int ifc = ifc_num_;
        (void)do_ioctl(fd_, USBDEVFS_RELEASEINTERFACE, &ifc);
        claimed_ = false;
    }

    if (driver_detached_) {
        (void)attach_kernel_driver_();
        driver_detached_ = false;
    }

    fd_.close();
}

core::Result<std::vector<std::uint8_t>> UsbFsDevice::control_in(ControlSetup s, std::uint16_t length) noexcept {
    using R = core::Result<std::vector<std::uint8_t>>;
    if (!fd_.valid()) return R::Failf(core::ErrorKind::Transport, "{}: device not open", devnode_);

    std::vector<std::uint8_t> buf(length);

    usbdevfs_ctrltransfer ct{};
    ct.bRequestType = static_cast<std::uint8_t>(s.request_type | USB_DIR_IN);
    ct.bRequest = s.request;
    ct.wValue = s.value;
    ct.wIndex = s.index;
    ct.wLength = length;
    ct.timeout = timeout_ms_;
    ct.data = buf.data();

    const int rc = do_ioctl(fd_, USBDEVFS_CONTROL, &ct);
    if (rc < 0) {
        const int e = errno;
        return R::Fail(errno_status(e, fmt::format("control in 0x{:02x}", s.request), devnode_));
    }

    buf.resize(static_cast<std::size_t>(rc));
    return R::Ok(std::move(buf));
}

int UsbFsDevice::control_out_raw_(ControlSetup s, std::span<const std::uint8_t> data) noexcept {
    std::vector<std::uint8_t> buf(data.begin(), data.end());

    usbdevfs_ctrltransfer ct{};
    ct.bRequestType = s.request_type;
    ct.bRequest = s.request;
    ct.wValue = s.value;
    ct.wIndex = s.index;
    ct.wLength = static_cast<std::uint16_t>(buf.size());
    ct.timeout = timeout_ms_;
    ct.data = buf.empty() ? nullptr : buf.data();

    return do_ioctl(fd_, USBDEVFS_CONTROL, &ct);
}

core::Status UsbFsDevice::control_out(ControlSetup s, std::span<const std::uint8_t> data) noexcept {
    if (!fd_.valid()) return core::Status::Failf(core::ErrorKind::Transport, "{}: device not open", devnode_);

    if (control_out_raw_(s, data) < 0) {
        const int e = errno;
        return errno_status(e, fmt::format("control out 0x{:02x}", s.request), devnode_);
    }
    return core::Status::Ok();
}

core::Status UsbFsDevice::control_out_expect_disconnect(ControlSetup s) noexcept {
    if (!fd_.valid()) return core::Status::Failf(core::ErrorKind::Transport, "{}: device not open", devnode_);

    if (control_out_raw_(s, {}) < 0) {
        const int e = errno;
        if (is_disconnect_errno(e)) {
            spdlog::debug("{}: disconnected after request 0x{:02x}", devnode_, s.request);
            return core::Status::Ok();
        }
        return errno_status(e, fmt::format("control out 0x{:02x}", s.request), devnode_);
    }
    return core::Status::Ok();
}

core::Status UsbFsDevice::bulk_out(std::uint8_t ep, std::span<const std::uint8_t> data) noexcept {
    if (!fd_.valid()) return core::Status::Failf(core::ErrorKind::Transport, "{}: device not open", devnode_);

    std::vector<std::uint8_t> buf(data.begin(), data.end());

    usbdevfs_bulktransfer bulk{};
    bulk.ep = ep;
    bulk.len = static_cast<unsigned>(buf.size());
    bulk.timeout = timeout_ms_;
    bulk.data = buf.data();

    const int rc = do_ioctl(fd_, USBDEVFS_BULK, &bulk);
    if (rc < 0) return errno_status(errno, "bulk out", devnode_);
    if (static_cast<std::size_t>(rc) != buf.size())
        return core::Status::Failf(core::ErrorKind::Transport, "bulk out {}: short write {}/{}", devnode_, rc, buf.size());
    return core::Status::Ok();
}

bool UsbFsDevice::kernel_driver_active_() const noexcept {
    if (!fd_.valid() || ifc_num_ < 0) return false;
    usbdevfs_getdriver gd{};
    gd.interface = static_cast<unsigned>(ifc_num_);
    return ::ioctl(fd_.fd, USBDEVFS_GETDRIVER, &gd) == 0;
}

bool UsbFsDevice::detach_kernel_driver_() noexcept {
    usbdevfs_ioctl cmd{};
    cmd.ifno = ifc_num_;
    cmd.ioctl_code = USBDEVFS_DISCONNECT;
    cmd.data = nullptr;
    return do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) == 0;
}

bool UsbFsDevice::attach_kernel_driver_() noexcept {
    usbdevfs_ioctl cmd{};
    cmd.ifno = ifc_num_;
    cmd.ioctl_code = USBDEVFS_CONNECT;
    cmd.data = nullptr;
    return do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) == 0;
}

core::Status UsbFsDevice::parse_descriptors_() noexcept {
    std::uint8_t buf[USB_DT_DEVICE_SIZE]{};
    // usbfs serves the cached descriptors through read().
    const auto n = do_read(fd_, buf, sizeof(buf));
    if (n < static_cast<ssize_t>(USB_DT_DEVICE_SIZE))
        return core::Status::Failf(core::ErrorKind::Transport, "Failed to read USB device descriptor: {}", devnode_);

    usb_device_descriptor dev{};
    std::memcpy(&dev, buf, sizeof(dev));
    if (dev.bLength < USB_DT_DEVICE_SIZE || dev.bDescriptorType != USB_DT_DEVICE)
        return core::Status::Failf(core::ErrorKind::Transport, "Malformed USB device descriptor: {}", devnode_);

    ids_.vendor  = dev.idVendor;
    ids_.product = dev.idProduct;
    return core::Status::Ok();
}

} // namespace pandad::linux
