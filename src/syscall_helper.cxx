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

#include "impl/syscall_helper.hxx"

#include <cerrno>

#include <string>
#include <system_error>

namespace vault_fixture::os_wrapper {

int current_errno() noexcept { return errno; }

void check_syscall_ret_val(std::string_view const file, int const line,
                           long const syscall_ret) {
  // `errno` is read only after a failure - earlier calls may have left it set
  if (syscall_ret < 0) {
    throw std::system_error{current_errno(), std::generic_category(),
                            std::string{file} + ":" + std::to_string(line) +
                                ": syscall returned " +
                                std::to_string(syscall_ret)};
  }
}

} // namespace vault_fixture::os_wrapper
