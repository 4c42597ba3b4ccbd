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

#include "vault_fixture/one_shot.hxx"
#include "vault_fixture/wait_for_result.hxx"

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include <doctest/doctest.h>

namespace vault_fixture {
namespace {

TEST_CASE("one_shot") {
  one_shot<std::string> signal;
  REQUIRE_FALSE(signal.is_set());
  REQUIRE_FALSE(signal.wait_for(std::chrono::milliseconds{1}));

  SUBCASE("written once") {
    REQUIRE(signal.set("first"));
    REQUIRE(signal.is_set());
    REQUIRE_EQ(signal.get(), "first");

    REQUIRE_FALSE(signal.set("second"));
    REQUIRE_EQ(signal.get(), "first");
  }

  SUBCASE("written by another thread") {
    std::thread writer{[&signal] {
      std::this_thread::sleep_for(std::chrono::milliseconds{20});
      CHECK(signal.set("from writer"));
    }};

    REQUIRE(signal.wait_for(std::chrono::seconds{5}));
    REQUIRE_EQ(signal.get(), "from writer");
    writer.join();
  }

  SUBCASE("racing writers") {
    std::atomic<int> accepted{0};
    std::thread a{[&] { accepted += signal.set("a") ? 1 : 0; }};
    std::thread b{[&] { accepted += signal.set("b") ? 1 : 0; }};
    a.join();
    b.join();

    REQUIRE_EQ(accepted.load(), 1);
    REQUIRE(signal.is_set());
  }
}

TEST_CASE("wait_for_result") {
  int calls{0};

  SUBCASE("reached eventually") {
    auto const res{wait_for_result(
        [&calls]() -> std::optional<std::string> {
          if (++calls < 3) {
            return "attempt " + std::to_string(calls);
          }
          return std::nullopt;
        },
        poll_options{std::chrono::milliseconds{1}, std::chrono::seconds{5}})};

    REQUIRE_FALSE(res.has_value());
    REQUIRE_EQ(calls, 3);
  }

  SUBCASE("reached right away") {
    auto const res{wait_for_result(
        [&calls]() -> std::optional<std::string> {
          ++calls;
          return std::nullopt;
        },
        poll_options{})};

    REQUIRE_FALSE(res.has_value());
    REQUIRE_EQ(calls, 1);
  }

  SUBCASE("timeout returns the last reason") {
    auto const begin{std::chrono::steady_clock::now()};
    auto const res{wait_for_result(
        [&calls]() -> std::optional<std::string> {
          return "attempt " + std::to_string(++calls);
        },
        poll_options{std::chrono::milliseconds{5},
                     std::chrono::milliseconds{100}})};
    auto const elapsed{std::chrono::steady_clock::now() - begin};

    REQUIRE(res.has_value());
    REQUIRE_EQ(*res, "attempt " + std::to_string(calls));
    REQUIRE_LT(1, calls);
    REQUIRE_LT(elapsed, std::chrono::seconds{5});
  }

  SUBCASE("zero timeout still checks once") {
    auto const res{wait_for_result(
        [&calls]() -> std::optional<std::string> {
          ++calls;
          return "never";
        },
        poll_options{std::chrono::milliseconds{10},
                     std::chrono::milliseconds{0}})};

    REQUIRE_EQ(res, std::optional<std::string>{"never"});
    REQUIRE_EQ(calls, 1);
  }

  SUBCASE("exceptions propagate") {
    auto const failing{[]() -> std::optional<std::string> {
      throw std::runtime_error{"gave up"};
    }};
    REQUIRE_THROWS_AS((wait_for_result(failing, poll_options{})),
                      std::runtime_error);
  }
}

} // namespace
} // namespace vault_fixture
