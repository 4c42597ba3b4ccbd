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

#include <cerrno>

#include <string_view>

namespace vault_fixture::os_wrapper {

[[nodiscard]] int current_errno() noexcept;

// throws `std::system_error` (`errno` + where it failed) if `syscall_ret` is
// negative
void check_syscall_ret_val(std::string_view const file, int const line,
                           long const syscall_ret);

// call the syscall directly, without this wrapper, where failure is expected
template <typename ret_t>
ret_t syscall_helper(std::string_view const file, int const line,
                     ret_t const syscall_ret) {
  check_syscall_ret_val(file, line, static_cast<long>(syscall_ret));
  return syscall_ret;
}

// repeats `fn` as long as it fails with `EINTR`
template <typename fn_t> auto retry_on_eintr(fn_t &&fn) {
  auto ret{fn()};
  while ((ret == -1) && (current_errno() == EINTR)) {
    ret = fn();
  }
  return ret;
}

} // namespace vault_fixture::os_wrapper

#define VAULT_FIXTURE_SYSCALL_HELPER(fn)                                       \
  ::vault_fixture::os_wrapper::syscall_helper<decltype(fn)>(__FILE__,          \
                                                            __LINE__, (fn))
