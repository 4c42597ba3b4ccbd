/*
  Copyright 2026 Lukáš Růžička

  This file is part of vault_fixture.

  vault_fixture is free software: you can redistribute it and/or modify it
  under the terms of the GNU Lesser General Public License as published by the
  Free Software Foundation, either version 3 of the License, or (at your option)
  any later version.

  vault_fixture is distributed in the hope that it will be useful, but WITHOUT
  ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
  FOR A PARTICULAR PURPOSE. See the GNU Lesser General Public License for more
  details.

  You should have received a copy of the GNU Lesser General Public License along
  with vault_fixture. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vault_fixture {

// receives raw chunks of a child's output, as they're read from the pipe; an
// empty chunk marks the end of the output
using output_sink = std::function<void(std::string_view)>;

using line_sink = std::function<void(std::string_view)>;

// splits a byte stream into lines (without the trailing '\n'), masking every
// occurrence of the `secrets` before passing a line on
struct line_writer {
  explicit line_writer(line_sink aSink, std::vector<std::string> aSecrets = {})
      : sink{std::move(aSink)}, secrets{std::move(aSecrets)} {}

  line_writer(line_writer const &) = delete;
  line_writer &operator=(line_writer const &) = delete;

  ~line_writer() noexcept = default;

  // an empty `chunk` (end of output) flushes
  void write(std::string_view const chunk);

  // emits a trailing incomplete line, if any
  void flush();

  [[nodiscard]] static constexpr std::string_view redacted() {
    return "<redacted>";
  }

private:
  void emit(std::string line);

  line_sink sink;
  std::vector<std::string> secrets;
  std::string pending;
};

} // namespace vault_fixture
