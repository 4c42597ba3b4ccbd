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

#include <cstddef>
#include <stdexcept>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "vault_fixture/errors.hxx"

namespace vault_fixture {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::string_view constexpr http_scheme{"http://"};

} // namespace

vault_client::vault_client(std::string aAddress,
                           std::chrono::milliseconds const aTimeout)
    : addr{std::move(aAddress)}, timeout{aTimeout} {
  std::string_view rest{addr};
  if (rest.substr(0, http_scheme.size()) != http_scheme) {
    throw std::invalid_argument{"unsupported vault address \"" + addr +
                                "\" - expected http://<host>:<port>"};
  }
  rest.remove_prefix(http_scheme.size());
  if (!rest.empty() && (rest.back() == '/')) {
    rest.remove_suffix(1);
  }

  auto const colon{rest.rfind(':')};
  if ((colon == std::string_view::npos) || (colon == 0) ||
      (colon + 1 == rest.size())) {
    throw std::invalid_argument{"vault address \"" + addr +
                                "\" lacks host or port"};
  }
  host = std::string{rest.substr(0, colon)};
  port = std::string{rest.substr(colon + 1)};
}

bool vault_client::init_status() const {
  auto const res{request(false, "sys/init", {})};
  return res.at("initialized").get<bool>();
}

nlohmann::json vault_client::lookup_self() const {
  return request(false, "auth/token/lookup-self", {}).at("data");
}

nlohmann::json vault_client::read(std::string_view const path) const {
  return request(false, path, {});
}

nlohmann::json vault_client::write(std::string_view const path,
                                   nlohmann::json const &data) const {
  return request(true, path, data.dump());
}

nlohmann::json vault_client::request(bool const put,
                                     std::string_view const path,
                                     std::string body) const {
  std::string target{"/v1/"};
  target.append(path);

  http::request<http::string_body> req{put ? http::verb::put : http::verb::get,
                                       target, 11};
  req.set(http::field::host, host + ":" + port);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  if (!token.empty()) {
    req.set("X-Vault-Token", token);
  }
  if (put) {
    req.set(http::field::content_type, "application/json");
    req.body() = std::move(body);
  }
  req.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::error_code failure;

  // the `tcp_stream` deadline is enforced for asynchronous operations only -
  // one deadline for connect, write & read together
  stream.expires_after(timeout);
  stream.async_connect(
      resolver.resolve(host, port),
      [&](beast::error_code const connect_ec, tcp::endpoint const &) {
        if (connect_ec) {
          failure = connect_ec;
          return;
        }
        http::async_write(
            stream, req, [&](beast::error_code const write_ec, std::size_t) {
              if (write_ec) {
                failure = write_ec;
                return;
              }
              http::async_read(stream, buffer, res,
                               [&](beast::error_code const read_ec,
                                   std::size_t) { failure = read_ec; });
            });
      });
  ioc.run();

  if (failure) {
    throw beast::system_error{failure};
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  // `not_connected` happens sometimes, the server may close first
  if (ec && (ec != beast::errc::not_connected)) {
    throw beast::system_error{ec};
  }

  if (http::to_status_class(res.result()) != http::status_class::successful) {
    throw api_error{res.result_int(), res.body()};
  }

  if (res.body().empty()) {
    return nlohmann::json::object();
  }
  return nlohmann::json::parse(res.body());
}

} // namespace vault_fixture
