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

#include "board/health.hpp"
#include "board/types.hpp"
#include "core/status.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pandad::board {

// Handle to one board running either its firmware or the bootstub.
// Hardware type, MCU family and bootstub state are read on open and
// refreshed after every flash() / recover().
class IBoard {
 public:
  virtual ~IBoard() = default;

  virtual const std::string& serial() const noexcept = 0;
  virtual HwType type() const noexcept = 0;
  virtual McuType mcu_type() const noexcept = 0;
  virtual bool bootstub() const noexcept = 0;

  virtual core::Result<std::string> version() = 0;
  virtual core::Result<Signature> signature() = 0;

  virtual core::Status flash() = 0;
  // Installs a development bootloader through the ROM DFU path.
  virtual core::Status recover() = 0;
  virtual core::Status reset() = 0;
  virtual core::Result<HealthRecord> health() = 0;

  virtual void close() noexcept = 0;
};

// Handle to a board sitting in the MCU's ROM bootloader.
class IDfuBoard {
 public:
  virtual ~IDfuBoard() = default;

  virtual const std::string& serial() const noexcept = 0;
  virtual core::Status recover() = 0;
  virtual void close() noexcept = 0;
};

class IBoardDriver {
 public:
  virtual ~IBoardDriver() = default;

  virtual std::vector<std::string> list() = 0;
  virtual std::vector<std::string> list_dfu() = 0;

  virtual core::Result<std::unique_ptr<IBoard>> open(const std::string& serial) = 0;
  virtual core::Result<std::unique_ptr<IDfuBoard>> open_dfu(const std::string& dfu_serial) = 0;
};

} // namespace pandad::board
