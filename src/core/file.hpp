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

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace pandad::core {

struct File {
  using ByteArray = std::vector<std::uint8_t>;
  static constexpr std::uint64_t kMax = 4ull * 1024ull * 1024ull;

  static Result<ByteArray> read_all(const std::filesystem::path& p) noexcept {
    std::error_code ec;
    const auto sz = std::filesystem::file_size(p, ec);
    if (ec) return Result<ByteArray>::Failf(ErrorKind::Io, "Cannot stat file: {}", p.string());
    if (static_cast<std::uint64_t>(sz) > kMax) return Result<ByteArray>::Failf(ErrorKind::Io, "File too large: {}", p.string());

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return Result<ByteArray>::Failf(ErrorKind::Io, "Cannot open file: {}", p.string());

    ByteArray buf(static_cast<std::size_t>(sz));
    if (!buf.empty()) {
      in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
      if (!in.good()) return Result<ByteArray>::Failf(ErrorKind::Io, "Read failed: {}", p.string());
    }
    return Result<ByteArray>::Ok(std::move(buf));
  }
};

} // namespace pandad::core
