#pragma once

// ============================================================================
// API Session - HTTP 会话处理
//
//   POST /api/perspectives   处理一个请求
//   GET  /api/perspectives   已加载的 perspective 列表
//   GET  /api/modifiers      modifier 目录
// ============================================================================

#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../perspective/engine.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

// ============================================================================
// ApiSession - HTTP 会话
// ============================================================================
class ApiSession : public std::enable_shared_from_this<ApiSession> {
public:
  ApiSession(tcp::socket socket, perspective::PerspectiveEngine &engine)
      : socket_(std::move(socket)), engine_(engine) {}

  void run() {
    do_read();
  }

private:
  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                       if (ec)
                         return;
                       self->handle_request();
                     });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());

    res_.set(http::field::access_control_allow_origin, "*");
    res_.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res_.set(http::field::access_control_allow_headers, "Content-Type");
    res_.set(http::field::content_type, "application/json");

    if (req_.method() == http::verb::options) {
      res_.result(http::status::ok);
      return do_write();
    }

    std::string target(req_.target());

    try {
      if (target.starts_with("/api/perspectives") && req_.method() == http::verb::post) {
        handle_process();
      } else if (target.starts_with("/api/perspectives")) {
        handle_list_perspectives();
      } else if (target.starts_with("/api/modifiers")) {
        handle_list_modifiers();
      } else {
        res_.result(http::status::not_found);
        res_.body() = R"({"error":"Not found"})";
      }
    } catch (const perspective::InputError &e) {
      fail(http::status::bad_request, e.what());
    } catch (const perspective::ConfigError &e) {
      fail(http::status::bad_request, e.what());
    } catch (const std::exception &e) {
      fail(http::status::internal_server_error, e.what());
    }

    res_.prepare_payload();
    do_write();
  }

  void fail(http::status status, const std::string &msg) {
    std::cerr << "[HTTP] " << req_.target() << " -> " << static_cast<int>(status) << ": " << msg << std::endl;
    res_.result(status);
    res_.body() = json{{"error", msg}}.dump();
  }

  void handle_process() {
    json request = json::parse(req_.body(), nullptr, false);
    if (request.is_discarded())
      throw perspective::InputError("request body is not valid JSON");

    json result = engine_.process(request);
    res_.result(http::status::ok);
    res_.body() = result.dump();
  }

  void handle_list_perspectives() {
    json list = json::array();
    for (auto &[id, p] : engine_.config().perspectives())
      list.push_back({{"id", id}, {"name", p.name}, {"rules", p.rules.size()}});
    res_.result(http::status::ok);
    res_.body() = list.dump();
  }

  void handle_list_modifiers() {
    json out = json::object();
    for (auto &[name, m] : engine_.config().modifiers())
      out[name] = m.to_json();
    res_.result(http::status::ok);
    res_.body() = json{{"modifiers", out}, {"default_modifiers", engine_.config().default_modifiers()}}.dump();
  }

  void do_write() {
    http::async_write(socket_, res_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        beast::error_code shutdown_ec;
                        [[maybe_unused]] auto ret = self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
                      });
  }

  tcp::socket socket_;
  perspective::PerspectiveEngine &engine_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};
