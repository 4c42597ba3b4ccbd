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

#include "vault_fixture/vault_client.hxx"
#include "vault_fixture/version.hxx"

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>

#include <doctest/doctest.h>

#include <test_support/test_support.hxx>

#include "vault_fixture/command.hxx"
#include "vault_fixture/errors.hxx"
#include "vault_fixture/port_source.hxx"
#include "vault_fixture/test_vault.hxx"

namespace vault_fixture {
namespace {

using test_support::contains;

TEST_CASE("vault_client - address") {
  REQUIRE_EQ(vault_client{"http://127.0.0.1:8200"}.address(),
             "http://127.0.0.1:8200");
  REQUIRE_NOTHROW(vault_client{"http://localhost:8200/"});

  REQUIRE_THROWS_AS(vault_client{"https://127.0.0.1:8200"},
                    std::invalid_argument);
  REQUIRE_THROWS_AS(vault_client{"127.0.0.1:8200"}, std::invalid_argument);
  REQUIRE_THROWS_AS(vault_client{"http://127.0.0.1"}, std::invalid_argument);
  REQUIRE_THROWS_AS(vault_client{"http://:8200"}, std::invalid_argument);
  REQUIRE_THROWS_AS(vault_client{"http://127.0.0.1:"}, std::invalid_argument);
}

TEST_CASE("vault_client - nobody listening") {
  auto &ports{default_port_source()};
  auto const port{ports.acquire(1)};

  vault_client client{http_address_for(port.front()),
                      std::chrono::milliseconds{500}};
  REQUIRE_THROWS_AS(static_cast<void>(client.init_status()),
                    boost::system::system_error);

  ports.release(port);
}

TEST_CASE("vault_client - server never answers") {
  auto &ports{default_port_source()};
  auto const port{ports.acquire(1)};
  {
    // listening, but never accepting - the connection still succeeds (it
    // waits in the backlog), the request goes unanswered
    test_support::port_occupier const silent{port.front()};

    vault_client client{http_address_for(port.front()),
                        std::chrono::milliseconds{200}};
    auto const begin{std::chrono::steady_clock::now()};
    try {
      static_cast<void>(client.init_status());
      FAIL("the request should have timed out");
    } catch (boost::system::system_error const &e) {
      REQUIRE(e.code() == boost::beast::error::timeout);
    }
    REQUIRE_LT(std::chrono::steady_clock::now() - begin,
               std::chrono::seconds{5});
  }
  ports.release(port);
}

TEST_CASE("vault_client - API") {
  auto tv{test_vault::launch(test_support::fake_vault_options())};

  SUBCASE("without token") {
    vault_client anonymous{tv->get_http_address()};
    REQUIRE(anonymous.init_status());

    try {
      static_cast<void>(anonymous.lookup_self());
      FAIL("lookup-self should have been refused");
    } catch (api_error const &e) {
      REQUIRE_EQ(e.status, 403u);
      REQUIRE(contains(e.body, "permission denied"));
    }
  }

  SUBCASE("wrong token") {
    vault_client client{tv->get_http_address()};
    client.set_token("not-the-root-token");
    REQUIRE_THROWS_AS(static_cast<void>(client.lookup_self()), api_error);
  }

  SUBCASE("key/value") {
    auto const &client{tv->get_client()};

    auto const res{client->write("secret/db", {{"user", "app"}, {"port", 5432}})};
    REQUIRE(res.empty());

    auto const data{client->read("secret/db").at("data")};
    REQUIRE_EQ(data.at("user").get<std::string>(), "app");
    REQUIRE_EQ(data.at("port").get<int>(), 5432);

    try {
      static_cast<void>(client->read("secret/missing"));
      FAIL("reading a missing secret should fail");
    } catch (api_error const &e) {
      REQUIRE_EQ(e.status, 404u);
    }
  }

  tv->stop();
}

TEST_CASE("vault_version") {
  SUBCASE("reported") {
    auto const version{vault_version(VAULT_FIXTURE_FAKE_VAULT_PATH)};
    REQUIRE_EQ(version.rfind("Vault v1.15.6-fake", 0), 0u);
    REQUIRE_EQ(version.back(), '\n');
  }

  SUBCASE("missing binary") {
    REQUIRE_THROWS_AS(
        static_cast<void>(vault_version("/nonexistent/vault_fixture/vault")),
        vault_error);
  }

  SUBCASE("failing binary") {
    // `sh version` -> no such script
    try {
      static_cast<void>(vault_version("sh"));
      FAIL("`sh version` should have failed");
    } catch (vault_error const &e) {
      REQUIRE(contains(e.what(), "failed"));
    }
  }
}

} // namespace
} // namespace vault_fixture
