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

#include <cerrno>
#include <cstddef>
#include <cstring>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace pandad {

// Owns one descriptor. The wrappers log failures with the call's
// arguments and leave errno as the failing call set it.
struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  static FileHandle open(const char* path, int flags, mode_t mode, const char* flags_name) noexcept {
    FileHandle h{::open(path, flags | O_CLOEXEC, mode)};
    if (!h.valid()) {
      const int e = errno;
      spdlog::debug("open({}, {}): {}", path, flags_name, std::strerror(e));
      errno = e;
    }
    return h;
  }

  // Both ends close on exec.
  static bool pipe(FileHandle& rd, FileHandle& wr) noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      const int e = errno;
      spdlog::error("pipe2: {}", std::strerror(e));
      errno = e;
      return false;
    }
    rd = FileHandle{fds[0]};
    wr = FileHandle{fds[1]};
    return true;
  }

  static int socket(int domain, int type, int protocol,
                    const char* domain_name, const char* type_name, const char* proto_name) noexcept
  {
    const int rc = ::socket(domain, type, protocol);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("socket(domain={}, type={}, proto={}): {}", domain_name, type_name, proto_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  // EADDRINUSE is how a held instance lock shows up; not worth an error line.
  int bind(const struct sockaddr* addr, socklen_t addrlen) const noexcept {
    const int rc = ::bind(fd, addr, addrlen);
    if (rc != 0) {
      const int e = errno;
      spdlog::debug("bind(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  // Disconnect errors are expected while a board reboots; callers decide how loud to be.
  int ioctl(unsigned long request, void* arg, const char* req_name) const noexcept {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) {
      const int e = errno;
      spdlog::debug("ioctl(fd={}, req={}): {}", fd, req_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  ssize_t read(void* buf, std::size_t count) const noexcept {
    ssize_t rc = 0;
    do {
      rc = ::read(fd, buf, count);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  // Single write; callers that need the full buffer check the count.
  ssize_t write(const void* buf, std::size_t count) const noexcept {
    ssize_t rc = 0;
    do {
      rc = ::write(fd, buf, count);
    } while (rc < 0 && errno == EINTR);
    return rc;
  }

  int fsync() const noexcept { return ::fsync(fd); }
};

} // namespace pandad

#define do_open(path, flags, mode) (FileHandle::open(path, flags, mode, #flags))
#define do_socket(domain, type, protocol) (FileHandle::socket(domain, type, protocol, #domain, #type, #protocol))
#define do_bind(fd, addr, addrlen) ((fd).valid() ? (fd).bind(addr, addrlen) : -1)
#define do_ioctl(fd, request, arg) ((fd).valid() ? (fd).ioctl(request, arg, #request) : -1)
#define do_read(fd, buf, count) ((fd).valid() ? (fd).read(buf, count) : -1)
