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

#include "bringup/discovery.hpp"

#include "board/firmware_paths.hpp"
#include "bringup/firmware.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

using namespace std::chrono_literals;

using pandad::board::HwType;
using pandad::bringup::FirmwareResolver;
using pandad::bringup::discover_boards;
using pandad::core::ErrorKind;
using pandad::test::BoardScript;
using pandad::test::FakeDriver;
using pandad::test::Journal;
using pandad::test::RecordingSleeper;
using pandad::test::TempDir;
using pandad::test::count_prefix;
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

struct Firmware {
  TempDir dir;
  FirmwareResolver resolver{pandad::board::default_firmware_paths(dir.path())};

  Firmware() {
    write_image(dir.path() / "panda.bin.signed", make_signature(0x10));
    write_image(dir.path() / "panda_h7.bin.signed", make_signature(0x70));
  }
};

} // namespace

static void test_polls_until_board_appears() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  BoardScript s{.serial = "s1", .signature = make_signature(0x10)};
  drv.add(s);
  drv.hidden_polls = 3;

  RecordingSleeper sleeper;
  auto r = discover_boards(drv, fw.resolver, sleeper.fn(), {.dfu_settle = 1000ms, .poll_interval = 250ms});

  check("poll_ok", static_cast<bool>(r));
  check("poll_one_board", r && r.value.size() == 1 && r.value[0]->serial() == "s1");
  check("poll_list_calls", drv.list_calls == 4);
  check("poll_sleeps", sleeper.sleeps == (std::vector<std::chrono::milliseconds>{250ms, 250ms, 250ms}));
}

static void test_dfu_board_recovered_first() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  BoardScript s{.serial = "aabbccddeeff001122334455", .signature = make_signature(0x10)};
  drv.add_dfu("DFU0", s);

  RecordingSleeper sleeper;
  auto r = discover_boards(drv, fw.resolver, sleeper.fn());

  check("dfu_ok", static_cast<bool>(r));
  check("dfu_recovered", index_of(j, "dfu_recover:DFU0") >= 0);
  check("dfu_closed", index_of(j, "dfu_close:DFU0") > index_of(j, "dfu_recover:DFU0"));
  check("dfu_before_list", index_of(j, "dfu_recover:DFU0") < index_of(j, "list"));
  check("dfu_settle_sleep", !sleeper.sleeps.empty() && sleeper.sleeps.front() == 1000ms);
  check("dfu_board_opened", index_of(j, "open:aabbccddeeff001122334455") > index_of(j, "list"));
}

static void test_dfu_recovery_waits_for_reenumeration() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  BoardScript s{.serial = "0123456789abcdef01234567", .signature = make_signature(0x10)};
  drv.add_dfu("DFU1", s);
  drv.hidden_polls = 2;

  const pandad::core::Sleeper sleep = [&j](std::chrono::milliseconds d) {
    j.push_back("sleep:" + std::to_string(d.count()));
  };
  auto r = discover_boards(drv, fw.resolver, sleep, {.dfu_settle = 1000ms, .poll_interval = 250ms});

  check("reenum_ok", r && r.value.size() == 1);
  const Journal want{
    "list_dfu",
    "open_dfu:DFU1",
    "dfu_recover:DFU1",
    "dfu_close:DFU1",
    "sleep:1000",
    "list",
    "sleep:250",
    "list",
    "sleep:250",
    "list",
    "open:0123456789abcdef01234567",
  };
  check("reenum_prefix", j.size() >= want.size() && std::equal(want.begin(), want.end(), j.begin()));
  check("reenum_list_calls", drv.list_calls == 3);
}

static void test_h7_board_uses_h7_image() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  BoardScript red{.serial = "red", .type = HwType::RedPanda, .signature = make_signature(0x70)};
  BoardScript black{.serial = "black", .type = HwType::BlackPanda, .signature = make_signature(0x10)};
  drv.add(red);
  drv.add(black);

  RecordingSleeper sleeper;
  auto r = discover_boards(drv, fw.resolver, sleeper.fn());
  check("mcu_ok", r && r.value.size() == 2);
  check("mcu_no_flash", count_prefix(j, "flash:") == 0);
}

static void test_fatal_board_aborts_pass() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  BoardScript bad{.serial = "a-bad", .bootstub = true, .flash_leaves_bootstub = true, .recover_leaves_bootstub = true};
  BoardScript good{.serial = "b-good", .signature = make_signature(0x10)};
  drv.add(bad);
  drv.add(good);

  RecordingSleeper sleeper;
  auto r = discover_boards(drv, fw.resolver, sleeper.fn());
  check("fatal_fails", !r);
  check("fatal_kind", r.st.kind == ErrorKind::StillInBootstub);
  check("fatal_stops_pass", index_of(j, "open:b-good") < 0);
}

static void test_open_failure_is_transport() {
  Firmware fw;
  Journal j;
  FakeDriver drv(j);
  drv.normal.push_back("ghost");

  RecordingSleeper sleeper;
  auto r = discover_boards(drv, fw.resolver, sleeper.fn());
  check("open_fail", !r && r.st.kind == ErrorKind::Transport);
}

int main() {
  test_polls_until_board_appears();
  test_dfu_board_recovered_first();
  test_dfu_recovery_waits_for_reenumeration();
  test_h7_board_uses_h7_image();
  test_fatal_board_aborts_pass();
  test_open_failure_is_transport();

  std::fprintf(stdout, "discovery: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
