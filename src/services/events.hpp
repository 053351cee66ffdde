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

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
} // namespace spdlog

namespace pandad::services {

using Fields = std::vector<std::pair<std::string, std::string>>;

struct Event {
  std::string name;
  Fields fields;
  std::vector<std::pair<std::string, Fields>> objects;
};

class IEventSink {
 public:
  virtual ~IEventSink() = default;

  virtual void emit(const Event& e) = 0;
};

// Renders each event as a single JSON object on the `events` logger.
class SpdlogEventSink final : public IEventSink {
 public:
  SpdlogEventSink();
  explicit SpdlogEventSink(std::shared_ptr<spdlog::logger> logger);

  void emit(const Event& e) override;

  static std::string render(const Event& e);

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pandad::services
