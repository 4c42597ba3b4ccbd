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
#include <functional>
#include <optional>
#include <string>

namespace vault_fixture {

struct poll_options {
  std::chrono::milliseconds interval{10};
  std::chrono::milliseconds timeout{5'000};
};

// returns `std::nullopt` once the awaited state is reached, otherwise the
// reason why it isn't (yet)
using poll_check = std::function<std::optional<std::string>()>;

// Calls `check` (at least once) until it succeeds, sleeping `interval` in
// between. Returns `std::nullopt` on success, or the reason given by the last
// call once `timeout` elapsed. Exceptions thrown by `check` aren't caught.
[[nodiscard]] std::optional<std::string>
wait_for_result(poll_check const &check, poll_options const &opts);

} // namespace vault_fixture
