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

#include "vault_fixture/options.hxx"

#include <cstdlib>

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace vault_fixture {

double test_multiplier() {
  if (char const *const explicit_val{std::getenv("VAULT_FIXTURE_TEST_MULTIPLIER")};
      explicit_val != nullptr) {
    try {
      auto const val{std::stod(explicit_val)};
      if (0.0 < val) {
        return val;
      }
    } catch (std::logic_error const &e) { // `invalid_argument`, `out_of_range`
      spdlog::warn("ignoring VAULT_FIXTURE_TEST_MULTIPLIER=\"{}\": {}",
                   explicit_val, e.what());
    }
  }
  return std::getenv("CI") != nullptr ? 4.0 : 1.0;
}

} // namespace vault_fixture
