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

#include "bringup/firmware.hpp"

#include "board/firmware_paths.hpp"
#include "fakes.hpp"

#include <cstdio>
#include <fstream>

using pandad::board::McuType;
using pandad::bringup::FirmwareResolver;
using pandad::bringup::signature_from_firmware;
using pandad::core::ErrorKind;
using pandad::test::TempDir;
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

static void test_signature_is_image_tail() {
  TempDir d;
  const auto img = d.path() / "panda.bin.signed";
  write_image(img, make_signature(0x42), 1000);

  auto r = signature_from_firmware(img);
  check("tail_ok", static_cast<bool>(r));
  check("tail_value", r && r.value == make_signature(0x42));
}

static void test_image_exactly_signature_sized() {
  TempDir d;
  const auto img = d.path() / "tiny.signed";
  write_image(img, make_signature(7), 0);

  auto r = signature_from_firmware(img);
  check("exact_ok", r && r.value == make_signature(7));
}

static void test_missing_and_short_images() {
  TempDir d;
  auto missing = signature_from_firmware(d.path() / "nope.bin.signed");
  check("missing_fails", !missing && missing.st.kind == ErrorKind::SignatureResolution);

  const auto shortp = d.path() / "short.bin.signed";
  {
    std::ofstream out(shortp, std::ios::binary);
    out << "too short";
  }
  auto short_r = signature_from_firmware(shortp);
  check("short_fails", !short_r && short_r.st.kind == ErrorKind::SignatureResolution);
}

static void test_resolver_selects_image_by_mcu() {
  TempDir d;
  write_image(d.path() / "panda.bin.signed", make_signature(1));
  write_image(d.path() / "panda_h7.bin.signed", make_signature(2));
  const FirmwareResolver fw(pandad::board::default_firmware_paths(d.path()));

  check("resolver_h7", fw.expected_signature(McuType::H7) == make_signature(2));
  check("resolver_f4", fw.expected_signature(McuType::F4) == make_signature(1));
  check("resolver_f2", fw.expected_signature(McuType::F2) == make_signature(1));
  check("resolver_unknown", fw.expected_signature(McuType::Unknown) == make_signature(1));
  check("resolver_image_h7", fw.image_for(McuType::H7).filename() == "panda_h7.bin.signed");
}

static void test_resolver_failure_is_empty() {
  TempDir d;
  write_image(d.path() / "panda.bin.signed", make_signature(1));
  const FirmwareResolver fw(pandad::board::default_firmware_paths(d.path()));

  const auto sig = fw.expected_signature(McuType::H7);
  check("resolver_empty", sig.empty());
  check("resolver_empty_differs", sig != make_signature(2));
}

int main() {
  test_signature_is_image_tail();
  test_image_exactly_signature_sized();
  test_missing_and_short_images();
  test_resolver_selects_image_by_mcu();
  test_resolver_failure_is_empty();

  std::fprintf(stdout, "firmware: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
