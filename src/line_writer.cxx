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

#include "vault_fixture/line_writer.hxx"

#include <utility>

namespace vault_fixture {

void line_writer::write(std::string_view const chunk) {
  if (chunk.empty()) {
    flush();
    return;
  }
  pending.append(chunk);

  std::string::size_type start{0};
  for (auto newline{pending.find('\n', start)}; newline != std::string::npos;
       newline = pending.find('\n', start)) {
    auto line_end{newline};
    if ((start < line_end) && (pending[line_end - 1] == '\r')) {
      --line_end;
    }
    emit(pending.substr(start, line_end - start));
    start = newline + 1;
  }
  pending.erase(0, start);
}

void line_writer::flush() {
  if (!pending.empty()) {
    emit(std::exchange(pending, {}));
  }
}

void line_writer::emit(std::string line) {
  for (auto const &secret : secrets) {
    if (secret.empty()) {
      continue;
    }
    for (auto pos{line.find(secret)}; pos != std::string::npos;
         pos = line.find(secret, pos + redacted().size())) {
      line.replace(pos, secret.size(), redacted());
    }
  }
  sink(line);
}

} // namespace vault_fixture
