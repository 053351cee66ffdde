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

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace pandad::bringup {

namespace fs = std::filesystem;

core::Result<board::Signature> signature_from_firmware(const fs::path& image) noexcept {
  using R = core::Result<board::Signature>;

  std::error_code ec;
  const auto sz = fs::file_size(image, ec);
  if (ec) return R::Failf(core::ErrorKind::SignatureResolution, "Cannot stat firmware {}: {}", image.string(), ec.message());
  if (sz < kSignatureSize)
    return R::Failf(core::ErrorKind::SignatureResolution, "Firmware {} too small for a signature ({} bytes)", image.string(), sz);

  std::ifstream in(image, std::ios::binary);
  if (!in.is_open()) return R::Failf(core::ErrorKind::SignatureResolution, "Cannot open firmware {}", image.string());

  in.seekg(-static_cast<std::streamoff>(kSignatureSize), std::ios::end);
  board::Signature sig(kSignatureSize);
  in.read(reinterpret_cast<char*>(sig.data()), static_cast<std::streamsize>(sig.size()));
  if (!in.good()) return R::Failf(core::ErrorKind::SignatureResolution, "Read failed: {}", image.string());

  return R::Ok(std::move(sig));
}

const fs::path& FirmwareResolver::image_for(board::McuType mcu) const noexcept {
  return paths_.image_for(mcu);
}

board::Signature FirmwareResolver::expected_signature(board::McuType mcu) const {
  auto r = signature_from_firmware(image_for(mcu));
  if (!r) {
    spdlog::error("Error computing expected signature: {}", r.st.msg);
    return {};
  }
  return std::move(r.value);
}

} // namespace pandad::bringup
