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

#include "vault_fixture/random_source.hxx"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace vault_fixture {

random_source::random_source() : engine{std::random_device{}()} {}

std::chrono::milliseconds
random_source::backoff(std::chrono::milliseconds const max) {
  if (max.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  std::uniform_int_distribution<std::chrono::milliseconds::rep> dist{
      0, max.count() - 1};
  return std::chrono::milliseconds{dist(engine)};
}

std::string random_source::token() {
  boost::uuids::basic_random_generator<std::mt19937> gen{&engine};
  return boost::uuids::to_string(gen());
}

} // namespace vault_fixture
