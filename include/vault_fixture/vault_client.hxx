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

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace vault_fixture {

// Minimal blocking HTTP/1.1 client of the vault API, one connection per
// request, bounded by `timeout` as a whole. Non-2xx answers throw `api_error`,
// transport failures (the timeout included) `boost::system::system_error`.
struct vault_client {
  // `aAddress` ~ "http://<host>:<port>"
  explicit vault_client(std::string aAddress,
                        std::chrono::milliseconds const aTimeout =
                            std::chrono::milliseconds{1'000});

  [[nodiscard]] std::string const &address() const noexcept { return addr; }

  // sent as `X-Vault-Token` with every request
  void set_token(std::string aToken) { token = std::move(aToken); }
  [[nodiscard]] std::string const &get_token() const noexcept { return token; }

  // `GET /v1/sys/init`
  [[nodiscard]] bool init_status() const;

  // `GET /v1/auth/token/lookup-self` -> its `data`
  [[nodiscard]] nlohmann::json lookup_self() const;

  // `GET /v1/<path>`
  [[nodiscard]] nlohmann::json read(std::string_view const path) const;

  // `PUT /v1/<path>`; the (possibly empty) response body
  nlohmann::json write(std::string_view const path,
                       nlohmann::json const &data) const;

private:
  [[nodiscard]] nlohmann::json request(bool const put,
                                       std::string_view const path,
                                       std::string body) const;

  std::string addr;
  std::string host;
  std::string port;
  std::chrono::milliseconds timeout;
  std::string token;
};

} // namespace vault_fixture
