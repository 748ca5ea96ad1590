// session.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "api_router.hpp"

// One HTTP connection: read a request, route it, write the response, repeat
// while the client keeps the connection alive. The socket's executor must be
// a strand; every handler of the session runs on it.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket, ApiRouter& router, std::uint64_t body_limit);
    void start();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);
    void reply_to_bad_request(boost::beast::error_code ec);
    void do_write(HttpResponse res);
    void do_close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer read_buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<HttpResponse> pending_response_;
    ApiRouter& router_;
    std::uint64_t body_limit_;
    std::string peer_;
};
