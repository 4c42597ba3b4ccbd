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

namespace vault_fixture::os_wrapper {

using native_fd_t = int;
static native_fd_t constexpr invalid_fd{-1};

} // namespace vault_fixture::os_wrapper
