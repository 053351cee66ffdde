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

#include "bringup/supervisor.hpp"

#include "board/firmware_paths.hpp"
#include "fakes.hpp"

#include <cstdio>
#include <string>
#include <vector>

using pandad::board::HwType;
using pandad::bringup::FirmwareResolver;
using pandad::bringup::Supervisor;
using pandad::bringup::SupervisorDeps;
using pandad::core::ErrorKind;
using pandad::test::BoardScript;
using pandad::test::FakeDriver;
using pandad::test::Journal;
using pandad::test::MemorySettings;
using pandad::test::RecordingEvents;
using pandad::test::RecordingSleeper;
using pandad::test::ScriptedLauncher;
using pandad::test::TempDir;
using pandad::test::count_prefix;
using pandad::test::has;
using pandad::test::index_of;
using pandad::test::make_signature;
using pandad::test::write_image;

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

namespace {

// Collaborators for one Supervisor, wired the way run() wires the real ones.
struct Rig {
  TempDir dir;
  FirmwareResolver firmware{pandad::board::default_firmware_paths(dir.path())};
  Journal journal;
  FakeDriver driver{journal};
  MemorySettings settings;
  RecordingEvents events;
  ScriptedLauncher daemon;
  RecordingSleeper sleeper;

  explicit Rig(std::vector<int> exit_codes = {0}) : daemon(journal, std::move(exit_codes)) {
    write_image(dir.path() / "panda.bin.signed", make_signature(0x10));
    write_image(dir.path() / "panda_h7.bin.signed", make_signature(0x70));
  }

  Supervisor supervisor() {
    return Supervisor(SupervisorDeps{
      .driver = driver,
      .firmware = firmware,
      .settings = settings,
      .events = events,
      .daemon = daemon,
      .sleep = sleeper.fn(),
    });
  }
};

} // namespace

// Internal board already verified, external board in bootstub.
static void test_internal_and_bootstub_external() {
  Rig rig;
  BoardScript ext{.serial = "0ext", .type = HwType::BlackPanda, .bootstub = true, .flashed_signature = make_signature(0x10)};
  BoardScript uno{.serial = "9uno", .type = HwType::Uno, .signature = make_signature(0x10)};
  rig.driver.add(ext);
  rig.driver.add(uno);

  auto sup = rig.supervisor();
  auto r = sup.run_once();

  const auto& j = rig.journal;
  check("scenario_ok", r && r.value.ok());
  check("scenario_flash_external_only", count_prefix(j, "flash:") == 1 && has(j, "flash:0ext"));
  check("scenario_no_recover", count_prefix(j, "recover:") == 0);
  check("scenario_daemon_args", rig.daemon.calls.size() == 1 &&
                                rig.daemon.calls[0] == (std::vector<std::string>{"9uno", "0ext"}));
}

static void test_health_reset_close_before_launch() {
  Rig rig;
  BoardScript a{.serial = "a", .signature = make_signature(0x10)};
  BoardScript b{.serial = "b", .type = HwType::Dos, .signature = make_signature(0x10)};
  rig.driver.add(a);
  rig.driver.add(b);

  auto sup = rig.supervisor();
  auto r = sup.run_once();

  const auto& j = rig.journal;
  const auto launch = index_of(j, "launch");
  check("order_ok", static_cast<bool>(r));
  for (const char* s : {"a", "b"}) {
    const std::string sn = s;
    check("order_health_before_reset", index_of(j, "health:" + sn) < index_of(j, "reset:" + sn));
    check("order_reset_before_close", index_of(j, "reset:" + sn) < index_of(j, "close:" + sn));
    check("order_close_before_launch", index_of(j, "close:" + sn) < launch);
  }
  check("order_all_reset", count_prefix(j, "reset:") == 2);
  check("order_args", rig.daemon.calls.at(0) == (std::vector<std::string>{"b", "a"}));
}

static void test_heartbeat_lost_is_reported() {
  Rig rig;
  BoardScript a{.serial = "hb", .signature = make_signature(0x10), .heartbeat_lost = true};
  BoardScript b{.serial = "fine", .signature = make_signature(0x10)};
  rig.driver.add(a);
  rig.driver.add(b);

  auto sup = rig.supervisor();
  auto r = sup.run_once();

  check("heartbeat_not_fatal", r && rig.daemon.calls.size() == 1);
  check("heartbeat_flag", rig.settings.values.count("PandaHeartbeatLost") == 1 &&
                          rig.settings.values["PandaHeartbeatLost"]);
  check("heartbeat_one_event", rig.events.events.size() == 1);
  if (rig.events.events.size() == 1) {
    const auto& e = rig.events.events[0];
    check("heartbeat_event_name", e.name == "heartbeat lost");
    check("heartbeat_event_serial", e.fields == (pandad::services::Fields{{"serial", "hb"}}));
    check("heartbeat_event_state", e.objects.size() == 1 && e.objects[0].first == "deviceState");
    bool flagged = false;
    for (const auto& [k, v] : e.objects[0].second) flagged |= (k == "heartbeat_lost" && v == "true");
    check("heartbeat_event_field", flagged);
  }
}

static void test_settings_failure_is_not_fatal() {
  Rig rig;
  rig.settings.fail_with = pandad::core::Status::Fail(ErrorKind::Io, "read-only");
  BoardScript a{.serial = "hb", .signature = make_signature(0x10), .heartbeat_lost = true};
  rig.driver.add(a);

  auto sup = rig.supervisor();
  auto r = sup.run_once();
  check("settings_fail_continues", r && rig.daemon.calls.size() == 1);
  check("settings_fail_still_emits", rig.events.events.size() == 1);
}

static void test_health_error_is_fatal() {
  Rig rig;
  BoardScript a{.serial = "sick", .signature = make_signature(0x10),
                .health_st = pandad::core::Status::Fail(ErrorKind::Transport, "stall")};
  rig.driver.add(a);

  auto sup = rig.supervisor();
  auto r = sup.run_once();
  check("health_fail", !r && r.st.kind == ErrorKind::Transport);
  check("health_fail_no_launch", rig.daemon.calls.empty());
  check("health_fail_no_reset", count_prefix(rig.journal, "reset:") == 0);
}

static void test_forever_repeats_after_daemon_exit() {
  Rig rig({1, 0});
  BoardScript a{.serial = "a", .signature = make_signature(0x10)};
  rig.driver.add(a);

  auto sup = rig.supervisor();
  const auto st = sup.run_forever();

  // Two daemon runs (one failed, one clean), then the launcher itself fails.
  check("forever_stops_on_fatal", !st && st.kind == ErrorKind::Io);
  check("forever_launches", rig.daemon.calls.size() == 3);
  check("forever_rediscovers", count_prefix(rig.journal, "open:a") == 3);
  check("forever_resets_each_time", count_prefix(rig.journal, "reset:a") == 3);
}

static void test_nonzero_exit_reported() {
  Rig rig({3});
  BoardScript a{.serial = "a", .signature = make_signature(0x10)};
  rig.driver.add(a);

  auto sup = rig.supervisor();
  auto r = sup.run_once();
  check("exit_code_ok_result", static_cast<bool>(r));
  check("exit_code_value", r && r.value.code == 3 && !r.value.ok());
}

int main() {
  test_internal_and_bootstub_external();
  test_health_reset_close_before_launch();
  test_heartbeat_lost_is_reported();
  test_settings_failure_is_not_fatal();
  test_health_error_is_fatal();
  test_forever_repeats_after_daemon_exit();
  test_nonzero_exit_reported();

  std::fprintf(stdout, "supervisor: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
