// server.hpp
#pragma once
#include <boost/asio.hpp>
#include <cstdint>
#include <string>
#include "api_router.hpp"

// message text is opaque and unbounded, so allow large bodies
constexpr std::uint64_t kDefaultBodyLimit = 64ull * 1024 * 1024;

// Accepts HTTP connections and hands each one to a Session running on its
// own strand.
class Server {
public:
    Server(boost::asio::io_context& ioc, const std::string& host, unsigned short port, ApiRouter& router,
           std::uint64_t body_limit = kDefaultBodyLimit);
    void run_accept();
    void stop();
    unsigned short port() const;

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::io_context& ioc_;
    ApiRouter& router_;
    std::uint64_t body_limit_;
};
