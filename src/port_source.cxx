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

#include "vault_fixture/port_source.hxx"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>

#include <random>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "impl/syscall_helper.hxx"

namespace vault_fixture {

namespace {

// returns the bound socket, or `invalid_fd` if `port` is in use
[[nodiscard]] os_wrapper::native_fd_t try_bind(int const port,
                                               bool const listen_on_it) {
  auto const fd{VAULT_FIXTURE_SYSCALL_HELPER(
      socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0))};

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if ((bind(fd, reinterpret_cast<sockaddr const *>(&addr), sizeof(addr)) ==
       -1) ||
      (listen_on_it && (listen(fd, 1) == -1))) {
    close(fd);
    return os_wrapper::invalid_fd;
  }
  return fd;
}

[[nodiscard]] bool is_bindable(int const port) {
  auto const fd{try_bind(port, false)};
  if (fd == os_wrapper::invalid_fd) {
    return false;
  }
  close(fd);
  return true;
}

} // namespace

free_port_pool::free_port_pool(int const lowest, int const aBlockSize,
                               int const max_blocks)
    : block_size{aBlockSize} {
  if ((block_size < 2) || (max_blocks < 1) || (lowest < 1) ||
      (65'535 < lowest + block_size * max_blocks)) {
    throw std::invalid_argument{"invalid free port pool layout!"};
  }

  std::mt19937 engine{std::random_device{}()};
  auto const start_block{
      std::uniform_int_distribution<int>{0, max_blocks - 1}(engine)};

  for (int i{0}; i < max_blocks; ++i) {
    auto const candidate{lowest +
                         ((start_block + i) % max_blocks) * block_size};
    block_lock = try_bind(candidate, true);
    if (block_lock != os_wrapper::invalid_fd) {
      first_port = candidate;
      break;
    }
  }

  if (block_lock == os_wrapper::invalid_fd) {
    throw std::runtime_error{"no free port block left in [" +
                             std::to_string(lowest) + ", " +
                             std::to_string(lowest + block_size * max_blocks) +
                             ")!"};
  }

  for (int port{first_port + 1}; port < first_port + block_size; ++port) {
    free_ports.push_back(port);
  }
  spdlog::debug("free port pool reserved block [{}, {})", first_port,
                first_port + block_size);
}

free_port_pool::~free_port_pool() noexcept {
  if (!taken.empty()) {
    spdlog::warn("free port pool destroyed with {} port(s) still taken",
                 taken.size());
  }
  close(block_lock);
}

std::vector<int> free_port_pool::acquire(std::size_t const count) {
  std::lock_guard<std::mutex> lck{mtx};

  std::vector<int> ports;
  ports.reserve(count);

  // every free port gets at most one chance
  for (auto remaining{free_ports.size()};
       (ports.size() < count) && (0 < remaining); --remaining) {
    auto const port{free_ports.front()};
    free_ports.pop_front();

    if (is_bindable(port)) {
      ports.push_back(port);
    } else {
      free_ports.push_back(port); // used by someone else at the moment
    }
  }

  if (ports.size() < count) {
    free_ports.insert(free_ports.begin(), ports.begin(), ports.end());
    throw std::runtime_error{"couldn't acquire " + std::to_string(count) +
                             " free port(s), only " +
                             std::to_string(ports.size()) + " available!"};
  }

  taken.insert(ports.begin(), ports.end());
  return ports;
}

void free_port_pool::release(std::vector<int> const &ports) noexcept {
  std::lock_guard<std::mutex> lck{mtx};

  for (auto const port : ports) {
    if (taken.erase(port) == 0) {
      spdlog::warn("ignoring release of port {} - it isn't taken", port);
      continue;
    }
    // the most recently used ones are handed out last
    free_ports.push_back(port);
  }
}

port_source &default_port_source() {
  static free_port_pool pool;
  return pool;
}

} // namespace vault_fixture
