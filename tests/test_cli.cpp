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
#include "app/run.hpp"

#include <cstdio>
#include <initializer_list>
#include <string>
#include <vector>

using pandad::app::Options;
using pandad::app::parse_cli;
using pandad::core::ErrorKind;
using pandad::core::Result;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static Result<Options> parse(std::initializer_list<const char*> args) {
  std::vector<std::string> store{"pandad"};
  for (const char* a : args) store.emplace_back(a);
  std::vector<char*> argv;
  for (auto& s : store) argv.push_back(s.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(store.size()), argv.data());
}

static void test_defaults() {
  auto r = parse({});
  check("defaults_ok", static_cast<bool>(r));
  if (!r) return;
  const auto& o = r.value;
  check("default_once", !o.once && !o.verbose && !o.help && !o.version);
  check("default_basedir", o.basedir == "/data/openpilot");
  check("default_params", o.params_dir == "/data/params/d");
  check("default_workdir", o.daemon_workdir() == "/data/openpilot/selfdrive/boardd");
  check("default_exe", o.daemon_exe() == "./boardd");
  check("default_firmware", o.firmware_path() == "/data/openpilot/panda/board/obj");
}

static void test_values() {
  auto r = parse({"--basedir", "/opt/op", "--params-dir=/tmp/p", "--once", "-v"});
  check("values_ok", static_cast<bool>(r));
  if (!r) return;
  const auto& o = r.value;
  check("values_basedir", o.basedir == "/opt/op");
  check("values_params", o.params_dir == "/tmp/p");
  check("values_flags", o.once && o.verbose);
  check("values_firmware_follows_basedir", o.firmware_path() == "/opt/op/panda/board/obj");
  check("values_workdir_follows_basedir", o.daemon_workdir() == "/opt/op/selfdrive/boardd");
}

static void test_overrides() {
  auto r = parse({"--firmware-dir=/fw", "--daemon", "/usr/bin/fake-boardd"});
  check("override_ok", static_cast<bool>(r));
  if (!r) return;
  check("override_firmware", r.value.firmware_path() == "/fw");
  check("override_daemon", r.value.daemon_exe() == "/usr/bin/fake-boardd");
}

static void test_errors() {
  auto missing = parse({"--basedir"});
  check("missing_value", !missing && missing.st.kind == ErrorKind::Usage);

  auto empty = parse({"--params-dir="});
  check("empty_value", !empty && empty.st.kind == ErrorKind::Usage);

  auto unknown = parse({"--frobnicate"});
  check("unknown_option", !unknown && unknown.st.kind == ErrorKind::Usage);

  auto positional = parse({"serial123"});
  check("positional", !positional && positional.st.kind == ErrorKind::Usage);

  // A prefix of a known option is not that option.
  auto prefix = parse({"--basedirx=/a"});
  check("prefix_option", !prefix);
}

static void test_help_and_version() {
  auto r = parse({"--help", "--version"});
  check("help_version", r && r.value.help && r.value.version);
  check("usage_mentions_basedir", pandad::app::usage_text().find("--basedir") != std::string::npos);
}

static void test_exit_codes() {
  using pandad::app::RunResult;
  using pandad::app::result_for;
  check("code_usage", result_for(ErrorKind::Usage) == RunResult::InvalidUsage);
  check("code_io", result_for(ErrorKind::Io) == RunResult::kIOFail);
  check("code_transport", result_for(ErrorKind::Transport) == RunResult::kTransportFail);
  check("code_bootstub", result_for(ErrorKind::StillInBootstub) == RunResult::kFlashFail);
  check("code_mismatch", result_for(ErrorKind::SignatureMismatchAfterFlash) == RunResult::kFlashFail);
}

int main() {
  test_defaults();
  test_values();
  test_overrides();
  test_errors();
  test_help_and_version();
  test_exit_codes();

  std::fprintf(stdout, "cli: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
