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

#include "bringup/flash_fsm.hpp"

#include "fakes.hpp"

#include <cstdio>
#include <vector>

using pandad::bringup::FlashState;
using pandad::bringup::flash_board;
using pandad::core::ErrorKind;
using pandad::test::BoardScript;
using pandad::test::FakeBoard;
using pandad::test::Journal;
using pandad::test::count_prefix;
using pandad::test::has;
using pandad::test::index_of;
using pandad::test::make_signature;

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

static void test_verified_board_is_left_alone() {
  Journal j;
  BoardScript s{.serial = "ok", .signature = make_signature(1)};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(1));
  check("verified_state", out.state == FlashState::VerifiedOk && out.ok());
  check("verified_no_flash", count_prefix(j, "flash:") == 0);
  check("verified_no_recover", count_prefix(j, "recover:") == 0);
  check("verified_trail", out.trail == (std::vector<FlashState>{FlashState::Unverified, FlashState::VerifiedOk}));
}

static void test_mismatch_is_flashed() {
  Journal j;
  BoardScript s{.serial = "old", .signature = make_signature(1), .flashed_signature = make_signature(2)};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(2));
  check("mismatch_ok", out.ok());
  check("mismatch_one_flash", count_prefix(j, "flash:") == 1);
  check("mismatch_no_recover", count_prefix(j, "recover:") == 0);
  check("mismatch_trail", out.trail == (std::vector<FlashState>{FlashState::Unverified,
                                                                FlashState::SignatureMismatchOrBootstub,
                                                                FlashState::Flashed, FlashState::VerifiedOk}));
}

static void test_bootstub_flashes_before_recover() {
  Journal j;
  BoardScript s{.serial = "stub", .bootstub = true, .flashed_signature = make_signature(3),
                .flash_leaves_bootstub = true};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(3));
  check("bootstub_recovered_ok", out.ok());
  check("bootstub_flash_first", index_of(j, "flash:stub") >= 0 && index_of(j, "flash:stub") < index_of(j, "recover:stub"));
  check("bootstub_no_signature_read_before_flash", index_of(j, "signature:stub") > index_of(j, "flash:stub"));
  check("bootstub_trail", out.trail == (std::vector<FlashState>{FlashState::Unverified,
                                                                FlashState::SignatureMismatchOrBootstub,
                                                                FlashState::Flashed,
                                                                FlashState::BootstubAfterFlash,
                                                                FlashState::Recovered,
                                                                FlashState::VerifiedOk}));
}

static void test_bootstub_fixed_by_flash() {
  Journal j;
  BoardScript s{.serial = "stub", .bootstub = true, .flashed_signature = make_signature(4)};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(4));
  check("bootstub_flash_ok", out.ok());
  check("bootstub_flash_no_recover", count_prefix(j, "recover:") == 0);
}

static void test_still_in_bootstub_is_fatal() {
  Journal j;
  BoardScript s{.serial = "dead", .bootstub = true, .flashed_signature = make_signature(5),
                .flash_leaves_bootstub = true, .recover_leaves_bootstub = true};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(5));
  check("stuck_fatal", out.state == FlashState::Fatal && !out.ok());
  check("stuck_kind", out.st.kind == ErrorKind::StillInBootstub);
  // Nothing is called on the board after the failed recovery.
  check("stuck_recover_last", !j.empty() && j.back() == "recover:dead");
}

static void test_mismatch_after_flash_is_fatal() {
  Journal j;
  BoardScript s{.serial = "bad", .signature = make_signature(1), .flashed_signature = make_signature(9)};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(2));
  check("mismatch_after_fatal", out.state == FlashState::Fatal);
  check("mismatch_after_kind", out.st.kind == ErrorKind::SignatureMismatchAfterFlash);
  check("mismatch_after_single_flash", count_prefix(j, "flash:") == 1);
}

static void test_empty_expected_forces_flash() {
  Journal j;
  BoardScript s{.serial = "nofw", .signature = make_signature(1), .flashed_signature = make_signature(1)};
  FakeBoard b(s, j);

  const auto out = flash_board(b, {});
  check("empty_expected_flashed", has(j, "flash:nofw"));
  check("empty_expected_fatal", out.state == FlashState::Fatal && out.st.kind == ErrorKind::SignatureMismatchAfterFlash);
}

static void test_driver_error_is_fatal() {
  Journal j;
  BoardScript s{.serial = "io", .signature = make_signature(1), .flashed_signature = make_signature(2),
                .flash_st = pandad::core::Status::Fail(ErrorKind::Transport, "usb gone")};
  FakeBoard b(s, j);

  const auto out = flash_board(b, make_signature(2));
  check("driver_error_fatal", out.state == FlashState::Fatal);
  check("driver_error_kind", out.st.kind == ErrorKind::Transport && out.st.msg == "usb gone");
  check("driver_error_no_recover", count_prefix(j, "recover:") == 0);
}

static void test_state_names() {
  check("name_verified", pandad::bringup::to_string(FlashState::VerifiedOk) == "verified");
  check("name_fatal", pandad::bringup::to_string(FlashState::Fatal) == "fatal");
}

int main() {
  test_verified_board_is_left_alone();
  test_mismatch_is_flashed();
  test_bootstub_flashes_before_recover();
  test_bootstub_fixed_by_flash();
  test_still_in_bootstub_is_fatal();
  test_mismatch_after_flash_is_fatal();
  test_empty_expected_forces_flash();
  test_driver_error_is_fatal();
  test_state_names();

  std::fprintf(stdout, "flash_fsm: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
