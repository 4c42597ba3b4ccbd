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
#include <cstdint>
#include <random>
#include <string>

namespace vault_fixture {

// all the randomness a fixture needs; seed it for reproducible tests
struct random_source {
  // seeded from `std::random_device`
  random_source();
  explicit random_source(std::uint32_t const seed) : engine{seed} {}

  // uniformly distributed in `[0, max)`; zero for non-positive `max`
  [[nodiscard]] std::chrono::milliseconds
  backoff(std::chrono::milliseconds const max);

  // random (version 4) UUID, in its canonical textual form
  [[nodiscard]] std::string token();

private:
  std::mt19937 engine;
};

} // namespace vault_fixture
