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
#include <optional>
#include <string>
#include <string_view>

namespace pandad::app {

inline constexpr std::string_view kDefaultBasedir = "/data/openpilot";
inline constexpr std::string_view kDefaultParamsDir = "/data/params/d";

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;

    // Run a single supervision pass and exit with the daemon's status.
    bool once = false;

    std::filesystem::path basedir{kDefaultBasedir};
    std::optional<std::filesystem::path> firmware_dir;
    std::filesystem::path params_dir{kDefaultParamsDir};
    std::optional<std::filesystem::path> daemon;

    std::filesystem::path daemon_workdir() const { return basedir / "selfdrive" / "boardd"; }
    std::filesystem::path daemon_exe() const { return daemon.value_or("./boardd"); }
    std::filesystem::path firmware_path() const { return firmware_dir.value_or(basedir / "panda" / "board" / "obj"); }
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace pandad::app
