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

#include "core/str.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace pandad::bringup {

namespace {

constexpr std::size_t kSigLogChars = 16;

class Tracker {
 public:
  Tracker(FlashOutcome& out, const std::string& serial) : out_(out), serial_(serial) { enter(FlashState::Unverified); }

  void enter(FlashState s) {
    out_.state = s;
    out_.trail.push_back(s);
    spdlog::debug("Board {}: {}", serial_, to_string(s));
  }

  FlashOutcome& fatal(core::Status st) {
    enter(FlashState::Fatal);
    out_.st = std::move(st);
    return out_;
  }

 private:
  FlashOutcome& out_;
  const std::string& serial_;
};

} // namespace

std::string_view to_string(FlashState s) noexcept {
  switch (s) {
    case FlashState::Unverified: return "unverified";
    case FlashState::SignatureMismatchOrBootstub: return "signature mismatch or bootstub";
    case FlashState::Flashed: return "flashed";
    case FlashState::BootstubAfterFlash: return "bootstub after flash";
    case FlashState::Recovered: return "recovered";
    case FlashState::VerifiedOk: return "verified";
    case FlashState::Fatal: return "fatal";
  }
  return "unknown";
}

FlashOutcome flash_board(board::IBoard& b, const board::Signature& expected) {
  FlashOutcome out;
  Tracker t(out, b.serial());

  std::string version = "bootstub";
  board::Signature observed;
  if (!b.bootstub()) {
    auto vr = b.version();
    if (!vr) return t.fatal(std::move(vr.st));
    version = std::move(vr.value);

    auto sr = b.signature();
    if (!sr) return t.fatal(std::move(sr.st));
    observed = std::move(sr.value);
  }

  spdlog::warn("Board {} connected, version: {}, signature {}, expected {}",
               b.serial(), version,
               core::to_hex(observed, kSigLogChars),
               core::to_hex(expected, kSigLogChars));

  if (b.bootstub() || observed != expected) {
    t.enter(FlashState::SignatureMismatchOrBootstub);
    spdlog::info("Board firmware out of date, update required");
    if (auto st = b.flash(); !st) return t.fatal(std::move(st));
    t.enter(FlashState::Flashed);
    spdlog::info("Done flashing");
  }

  if (b.bootstub()) {
    t.enter(FlashState::BootstubAfterFlash);
    auto vr = b.version();
    if (!vr) return t.fatal(std::move(vr.st));
    spdlog::info("Flashed firmware not booting, flashing development bootloader. Bootstub version: {}", vr.value);
    if (auto st = b.recover(); !st) return t.fatal(std::move(st));
    t.enter(FlashState::Recovered);
    spdlog::info("Done flashing bootloader");
  }

  if (b.bootstub()) {
    spdlog::error("Board {} still not booting", b.serial());
    return t.fatal(core::Status::Failf(core::ErrorKind::StillInBootstub,
                                       "Board {} still in bootstub after flash and recovery", b.serial()));
  }

  auto sr = b.signature();
  if (!sr) return t.fatal(std::move(sr.st));
  if (sr.value != expected) {
    spdlog::error("Board {}: version mismatch after flashing", b.serial());
    return t.fatal(core::Status::Failf(core::ErrorKind::SignatureMismatchAfterFlash,
                                       "Board {} signature {} does not match expected {} after flashing",
                                       b.serial(), core::to_hex(sr.value, kSigLogChars),
                                       core::to_hex(expected, kSigLogChars)));
  }

  t.enter(FlashState::VerifiedOk);
  return out;
}

} // namespace pandad::bringup
