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

#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <vector>

#include "vault_fixture/native_fd_t.hxx"

namespace vault_fixture {

// hands out TCP ports no other user of the same source holds at the moment
struct port_source {
  virtual ~port_source() noexcept = default;

  // throws if `count` ports can't be provided
  [[nodiscard]] virtual std::vector<int> acquire(std::size_t const count) = 0;

  // ports not currently acquired from this source are ignored
  virtual void release(std::vector<int> const &ports) noexcept = 0;
};

// A block of `block_size` consecutive ports starting at `lowest + k *
// block_size` (for some `k < max_blocks`) is reserved for this process by
// listening on its first port; other processes using the same layout thus
// never pick the same block. The rest of the block is handed out, skipping
// ports that can't be bound at the moment.
struct free_port_pool final : public port_source {
  explicit free_port_pool(int const lowest = 10'000, int const block_size = 1'500,
                          int const max_blocks = 30);
  ~free_port_pool() noexcept override;

  [[nodiscard]] std::vector<int> acquire(std::size_t const count) override;
  void release(std::vector<int> const &ports) noexcept override;

  [[nodiscard]] int block_begin() const noexcept { return first_port; }
  [[nodiscard]] int block_end() const noexcept {
    return first_port + block_size;
  }

private:
  free_port_pool(free_port_pool const &) = delete;
  free_port_pool &operator=(free_port_pool const &) = delete;

  int const block_size;
  int first_port{0};
  os_wrapper::native_fd_t block_lock{os_wrapper::invalid_fd};

  std::mutex mtx;
  std::deque<int> free_ports;
  std::set<int> taken;
};

// process-wide pool, created on first use
[[nodiscard]] port_source &default_port_source();

} // namespace vault_fixture
