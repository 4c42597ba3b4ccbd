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

#include <chrono>
#include <string>
#include <vector>

namespace vault_fixture {

// what downstream consumers need to talk to the test instance
struct vault_config {
  bool enabled{false};
  std::string token;
  std::string addr;
};

// scale factor for every timeout below: `VAULT_FIXTURE_TEST_MULTIPLIER` if set
// to a positive number, else 4 when running under CI (`CI` is set), else 1
[[nodiscard]] double test_multiplier();

struct fixture_options {
  std::string binary{"vault"};
  std::vector<std::string> extra_env;

  // launch attempts of the eager `test_vault::launch`
  int attempts{11};
  std::chrono::milliseconds max_backoff{2'000};

  std::chrono::milliseconds start_timeout{500};
  std::chrono::milliseconds ready_timeout{5'000};
  std::chrono::milliseconds poll_interval{10};
  std::chrono::milliseconds request_timeout{1'000};
  std::chrono::milliseconds stop_timeout{1'000};

  double multiplier{test_multiplier()};

  [[nodiscard]] std::chrono::milliseconds
  scaled(std::chrono::milliseconds const timeout) const {
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(
            static_cast<double>(timeout.count()) * multiplier)};
  }
};

} // namespace vault_fixture
