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

#include "vault_fixture/pipe_helper.hxx"

#include <fcntl.h>
#include <unistd.h>

#include <cstring>

#include <spdlog/spdlog.h>

#include "impl/syscall_helper.hxx"

namespace vault_fixture::os_wrapper {

namespace {

// `EINTR` isn't retried - on Linux the descriptor is released regardless
// https://man7.org/linux/man-pages/man2/close.2.html
void close_fd(native_fd_t &fd) noexcept {
  if (fd == invalid_fd) {
    return;
  }
  if (close(fd) == -1) {
    auto const errno_val{current_errno()};
    spdlog::error("closing pipe end {} failed: {} ({})", fd,
                  std::strerror(errno_val), errno_val);
  }
  fd = invalid_fd;
}

} // namespace

pipe_helper::~pipe_helper() noexcept {
  close_out();
  close_in();
}

void pipe_helper::init() {
  close_out();
  close_in();
  // https://man7.org/linux/man-pages/man2/pipe.2.html
  VAULT_FIXTURE_SYSCALL_HELPER(pipe2(fds, O_CLOEXEC));
}

void pipe_helper::close_out() noexcept { close_fd(fds[0]); }

void pipe_helper::close_in() noexcept { close_fd(fds[1]); }

} // namespace vault_fixture::os_wrapper
