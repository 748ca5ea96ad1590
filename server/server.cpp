// server.cpp
#include "server.hpp"
#include <memory>
#include "session.hpp"
#include "logger.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Server::Server(asio::io_context& ioc, const std::string& host, unsigned short port, ApiRouter& router,
               std::uint64_t body_limit)
    : acceptor_(ioc, tcp::endpoint(asio::ip::make_address(host), port)), ioc_(ioc), router_(router),
      body_limit_(body_limit) {
    Logger::instance().info("Server constructed", { {"host", host}, {"port", acceptor_.local_endpoint().port()} });
}

void Server::run_accept() {
    // the io_context runs on several threads; a strand per connection keeps a
    // session's reads, writes and timeout handler serialized
    acceptor_.async_accept(asio::make_strand(ioc_), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            Logger::instance().info("Acceptor closed");
            return;
        }
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, body_limit_);
            Logger::instance().debug("New connection accepted");
            s->start();
        } else {
            Logger::instance().error("Accept error", { {"what", ec.message()}, {"value", ec.value()} });
        }
        run_accept();
    });
}

void Server::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) Logger::instance().warn("Acceptor close failed", { {"what", ec.message()} });
}

unsigned short Server::port() const {
    return acceptor_.local_endpoint().port();
}
