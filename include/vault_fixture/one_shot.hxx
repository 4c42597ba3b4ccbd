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

#include <atomic>
#include <chrono>
#include <future>
#include <utility>

namespace vault_fixture {

// single producer, any number of consumers; the value can be written only
// once - later writes are rejected (`set` returns `false`)
template <typename value_t> struct one_shot {
  one_shot() : reader{promise.get_future().share()} {}

  one_shot(one_shot const &) = delete;
  one_shot &operator=(one_shot const &) = delete;

  [[nodiscard]] bool set(value_t value) {
    if (written.exchange(true)) {
      return false;
    }
    promise.set_value(std::move(value));
    return true;
  }

  [[nodiscard]] bool is_set() const {
    return reader.wait_for(std::chrono::seconds{0}) ==
           std::future_status::ready;
  }

  template <typename rep_t, typename period_t>
  [[nodiscard]] bool
  wait_for(std::chrono::duration<rep_t, period_t> const timeout) const {
    return reader.wait_for(timeout) == std::future_status::ready;
  }

  // blocks until written
  [[nodiscard]] value_t const &get() const { return reader.get(); }

private:
  std::atomic<bool> written{false};
  std::promise<value_t> promise;
  std::shared_future<value_t> reader;
};

} // namespace vault_fixture
