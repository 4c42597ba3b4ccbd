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

#include <stdexcept>
#include <string>

namespace vault_fixture {

struct vault_error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// a single launch attempt failed - the process couldn't be executed, exited
// before the start timeout or never reported itself as initialized
struct startup_error : public vault_error {
  using vault_error::vault_error;
};

// the fixture is unusable: every launch attempt failed, or the process
// couldn't be confirmed dead during teardown
struct fatal_error : public vault_error {
  using vault_error::vault_error;
};

// the service answered, but with a non-2xx status
struct api_error : public vault_error {
  explicit api_error(unsigned const aStatus, std::string const &aBody)
      : vault_error{"vault API returned status " + std::to_string(aStatus) +
                    ": " + aBody},
        status{aStatus}, body{aBody} {}

  unsigned status;
  std::string body;
};

} // namespace vault_fixture
