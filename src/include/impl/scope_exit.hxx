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

#include <utility>

namespace vault_fixture::impl {

// runs the callable when leaving the scope, unless dismissed
template <typename fn_t> struct scope_exit {
  explicit scope_exit(fn_t &&aFn) noexcept : fn{std::move(aFn)} {}

  ~scope_exit() noexcept {
    if (armed) {
      fn();
    }
  }

  void dismiss() noexcept { armed = false; }

private:
  scope_exit(scope_exit const &) = delete;
  scope_exit &operator=(scope_exit const &) = delete;

  fn_t fn;
  bool armed{true};
};

} // namespace vault_fixture::impl
