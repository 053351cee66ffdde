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

#include "services/events.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pandad::services {

namespace {

void append_json_string(std::string& out, std::string_view s) {
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
        else
          out.push_back(c);
    }
  }
  out.push_back('"');
}

void append_fields(std::string& out, const Fields& fields, bool& first) {
  for (const auto& [k, v] : fields) {
    if (!first) out += ", ";
    first = false;
    append_json_string(out, k);
    out += ": ";
    append_json_string(out, v);
  }
}

} // namespace

SpdlogEventSink::SpdlogEventSink() {
  const auto& sinks = spdlog::default_logger()->sinks();
  logger_ = std::make_shared<spdlog::logger>("events", sinks.begin(), sinks.end());
}

SpdlogEventSink::SpdlogEventSink(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

std::string SpdlogEventSink::render(const Event& e) {
  std::string out = "{";
  bool first = true;
  append_fields(out, Fields{{"event", e.name}}, first);
  append_fields(out, e.fields, first);

  for (const auto& [name, obj] : e.objects) {
    if (!first) out += ", ";
    first = false;
    append_json_string(out, name);
    out += ": {";
    bool inner_first = true;
    append_fields(out, obj, inner_first);
    out += "}";
  }
  out += "}";
  return out;
}

void SpdlogEventSink::emit(const Event& e) {
  logger_->warn("{}", render(e));
}

} // namespace pandad::services
