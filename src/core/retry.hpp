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

#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <utility>

namespace pandad::core {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper real_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// Calls `fn` until it yields a non-empty container, sleeping `interval`
// between attempts. There is no attempt cap.
template <class Fn>
auto poll_until(Fn&& fn, std::chrono::milliseconds interval, const Sleeper& sleep) {
  for (;;) {
    auto v = fn();
    if (!v.empty()) return v;
    sleep(interval);
  }
}

// Bounded variant used where giving up is a valid outcome; returns an empty
// container after `attempts` misses.
template <class Fn>
auto poll_until(Fn&& fn, std::chrono::milliseconds interval, const Sleeper& sleep, std::size_t attempts) {
  decltype(fn()) v{};
  for (std::size_t i = 0; i < attempts; ++i) {
    v = fn();
    if (!v.empty()) return v;
    if (i + 1 < attempts) sleep(interval);
  }
  return v;
}

} // namespace pandad::core
