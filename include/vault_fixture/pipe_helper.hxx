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

#include "vault_fixture/native_fd_t.hxx"

namespace vault_fixture::os_wrapper {

// Owns both ends of a pipe, created with `O_CLOEXEC`: only the descriptors
// explicitly `dup2`-ed in a child survive its `exec`. Ends closed early (the
// parent's copy of the write end after `fork`) are just skipped later.
struct pipe_helper {
  pipe_helper() noexcept = default;
  ~pipe_helper() noexcept;

  pipe_helper(pipe_helper const &) = delete;
  pipe_helper &operator=(pipe_helper const &) = delete;

  void init();

  [[nodiscard]] native_fd_t get_out() const noexcept { return fds[0]; }
  [[nodiscard]] native_fd_t get_in() const noexcept { return fds[1]; }

  void close_out() noexcept;
  void close_in() noexcept;

private:
  native_fd_t fds[2]{invalid_fd, invalid_fd};
};

} // namespace vault_fixture::os_wrapper
