#pragma once

// ============================================================================
// API Server - HTTP 服务器
// ============================================================================

#include <iostream>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "../perspective/engine.hpp"
#include "api_session.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// ============================================================================
// ApiServer - HTTP 服务器
// ============================================================================
class ApiServer {
public:
  ApiServer(asio::io_context &ioc, perspective::PerspectiveEngine &engine, unsigned short port)
      : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), engine_(engine) {
    std::cout << "[HTTP] 监听端口 " << port << std::endl;
    do_accept();
  }

private:
  void do_accept() {
    acceptor_.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
          if (!ec) {
            std::make_shared<ApiSession>(std::move(socket), engine_)->run();
          } else {
            std::cerr << "[HTTP] accept: " << ec.message() << std::endl;
          }
          do_accept();
        });
  }

  tcp::acceptor acceptor_;
  perspective::PerspectiveEngine &engine_;
};
