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

#include "vault_fixture/version.hxx"

#include <exception>
#include <memory>

#include "vault_fixture/command.hxx"
#include "vault_fixture/errors.hxx"
#include "vault_fixture/process.hxx"

namespace vault_fixture {

std::string vault_version(std::string const &binary,
                          std::chrono::milliseconds const timeout) {
  // written by the watcher thread only, read after its completion
  auto const out{std::make_shared<std::string>()};
  auto const err{std::make_shared<std::string>()};

  os_wrapper::process proc{
      command{binary, {"version"}, current_environment()},
      [out](std::string_view const chunk) { out->append(chunk); },
      [err](std::string_view const chunk) { err->append(chunk); }};
  try {
    proc.start();
  } catch (std::exception const &e) {
    throw vault_error{"`" + binary + " version` couldn't be started: " +
                      e.what()};
  }

  if (!proc.completion().wait_for(timeout)) {
    throw vault_error{"`" + binary + " version` didn't finish in time"};
  }

  auto const &status{proc.completion().get()};
  if (!status.success()) {
    throw vault_error{"`" + binary + " version` failed: " + status.describe() +
                      (err->empty() ? std::string{} : " - " + *err)};
  }
  return *out;
}

} // namespace vault_fixture
