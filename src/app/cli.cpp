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

#include "app/cli.hpp"
#include "app/version.hpp"

#include <string_view>
#include <utility>

namespace pandad::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Failf(core::ErrorKind::Usage, "{} requires value", opt);
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static core::Result<std::filesystem::path> read_path_value(int& i, int argc, char** argv,
                                                           std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<std::filesystem::path>::Fail(std::move(vr.st));
  if (vr.value.empty()) return core::Result<std::filesystem::path>::Failf(core::ErrorKind::Usage, "{} requires a non-empty value", opt);
  return core::Result<std::filesystem::path>::Ok(std::filesystem::path(std::string(vr.value)));
}

std::string usage_text() {
  std::string out;
  out.reserve(1024);

  out += "pandad v";
  out += version_string();
  out += "\n\n";

  out += R"(Usage:
  pandad [--basedir <dir>] [--firmware-dir <dir>] [--params-dir <dir>] [--daemon <path>] [--once]

Options:
  --help
  --version
  --verbose, -v                enable verbose logging
  --basedir <dir>              installation root (default /data/openpilot); the daemon runs from <dir>/selfdrive/boardd
  --firmware-dir <dir>         firmware images (default <basedir>/panda/board/obj)
  --params-dir <dir>           durable settings directory (default /data/params/d)
  --daemon <path>              daemon executable (default ./boardd, relative to the daemon directory)
  --once                       run one bring-up and daemon pass, then exit with the daemon's status
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--verbose" || a == "-v") { o.verbose = true; continue; }
    if (a == "--once") { o.once = true; continue; }

    if (is_opt(a, "--basedir")) {
      auto pr = read_path_value(i, argc, argv, a, "--basedir");
      if (!pr) return core::Result<Options>::Fail(std::move(pr.st));
      o.basedir = std::move(pr.value);
      continue;
    }
    if (is_opt(a, "--firmware-dir")) {
      auto pr = read_path_value(i, argc, argv, a, "--firmware-dir");
      if (!pr) return core::Result<Options>::Fail(std::move(pr.st));
      o.firmware_dir = std::move(pr.value);
      continue;
    }
    if (is_opt(a, "--params-dir")) {
      auto pr = read_path_value(i, argc, argv, a, "--params-dir");
      if (!pr) return core::Result<Options>::Fail(std::move(pr.st));
      o.params_dir = std::move(pr.value);
      continue;
    }
    if (is_opt(a, "--daemon")) {
      auto pr = read_path_value(i, argc, argv, a, "--daemon");
      if (!pr) return core::Result<Options>::Fail(std::move(pr.st));
      o.daemon = std::move(pr.value);
      continue;
    }

    if (a.starts_with("-")) {
      return core::Result<Options>::Failf(core::ErrorKind::Usage, "Unknown option: {}", a);
    }

    return core::Result<Options>::Failf(core::ErrorKind::Usage, "Positional arguments are not supported: {}", a);
  }

  return core::Result<Options>::Ok(std::move(o));
}

} // namespace pandad::app
