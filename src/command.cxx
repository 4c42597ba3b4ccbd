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

#include "vault_fixture/command.hxx"

#include <algorithm>
#include <string_view>

extern char **environ;

namespace vault_fixture {

namespace {

[[nodiscard]] std::string_view env_key(std::string_view const entry) {
  return entry.substr(0, entry.find('='));
}

} // namespace

std::vector<std::string> current_environment() {
  std::vector<std::string> env;
  for (char **entry = environ; (entry != nullptr) && (*entry != nullptr);
       ++entry) {
    env.emplace_back(*entry);
  }
  return env;
}

std::vector<std::string>
merge_environment(std::vector<std::string> base,
                  std::vector<std::string> const &overrides) {
  for (auto const &entry : overrides) {
    auto const key{env_key(entry)};
    auto const it{std::find_if(base.begin(), base.end(),
                               [key](std::string const &existing) {
                                 return env_key(existing) == key;
                               })};
    if (it != base.end()) {
      *it = entry;
    } else {
      base.push_back(entry);
    }
  }
  return base;
}

std::string bind_address_for(int const port) {
  return "127.0.0.1:" + std::to_string(port);
}

std::string http_address_for(int const port) {
  return "http://" + bind_address_for(port);
}

command build_dev_server_command(std::string const &binary, int const port,
                                 std::string const &root_token,
                                 std::vector<std::string> const &extra_env) {
  return command{binary,
                 {"server", "-dev",
                  "-dev-listen-address=" + bind_address_for(port),
                  "-dev-root-token-id=" + root_token},
                 merge_environment(current_environment(), extra_env)};
}

} // namespace vault_fixture
