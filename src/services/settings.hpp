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

#include <filesystem>
#include <string_view>
#include <utility>

namespace pandad::services {

class ISettingsStore {
 public:
  virtual ~ISettingsStore() = default;

  virtual core::Status put_bool(std::string_view key, bool value) = 0;
};

// One file per key under `dir`, holding "1" or "0". Writes go through a
// temporary file and rename so readers never see a partial value.
class FileSettingsStore final : public ISettingsStore {
 public:
  explicit FileSettingsStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  core::Status put_bool(std::string_view key, bool value) override;

  const std::filesystem::path& dir() const noexcept { return dir_; }

 private:
  std::filesystem::path dir_;
};

} // namespace pandad::services
