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

#include <string>
#include <vector>

namespace vault_fixture {

// everything needed to `exec` a program; `path` is looked up in `PATH` when it
// contains no '/'
struct command {
  std::string path;
  std::vector<std::string> args;
  // complete environment of the child, `KEY=VALUE` entries
  std::vector<std::string> env;
};

// environment of the current process, in `environ` order
[[nodiscard]] std::vector<std::string> current_environment();

// `base` with `overrides` applied - an override replaces the entry with the same
// key, otherwise it's appended
[[nodiscard]] std::vector<std::string>
merge_environment(std::vector<std::string> base,
                  std::vector<std::string> const &overrides);

[[nodiscard]] std::string bind_address_for(int const port);
[[nodiscard]] std::string http_address_for(int const port);

// `<binary> server -dev -dev-listen-address=127.0.0.1:<port>
// -dev-root-token-id=<root_token>`
[[nodiscard]] command
build_dev_server_command(std::string const &binary, int const port,
                         std::string const &root_token,
                         std::vector<std::string> const &extra_env = {});

} // namespace vault_fixture
