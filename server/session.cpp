// session.cpp
#include "session.hpp"
#include <chrono>
#include <exception>
#include "logger.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {
constexpr std::chrono::seconds kIdleTimeout{60};

bool is_http_parse_error(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_target).category();
}
}

Session::Session(asio::ip::tcp::socket socket, ApiRouter& router, std::uint64_t body_limit)
    : stream_(std::move(socket)), router_(router), body_limit_(body_limit) {
    boost::system::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void Session::start() {
    Logger::instance().debug("Session start", { {"peer", peer_} });
    // the accept handler does not run on this connection's strand
    asio::dispatch(stream_.get_executor(), [self = shared_from_this()]() { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(body_limit_);
    stream_.expires_after(kIdleTimeout);
    auto self = shared_from_this();
    http::async_read(stream_, read_buffer_, *parser_, [this, self](beast::error_code ec, std::size_t bytes) {
        on_read(ec, bytes);
    });
}

void Session::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
        do_close();
        return;
    }
    if (ec && is_http_parse_error(ec)) {
        reply_to_bad_request(ec);
        return;
    }
    if (ec) {
        Logger::instance().info("Session read error/disconnect", { {"ec", ec.message()}, {"peer", peer_} });
        return;
    }

    HttpRequest req = parser_->release();
    HttpResponse res;
    try {
        res = router_.handle(req);
    } catch (const std::exception& ex) {
        Logger::instance().error("Request handler failed", { {"what", ex.what()}, {"target", std::string(req.target())}, {"peer", peer_} });
        res = HttpResponse{ http::status::internal_server_error, req.version() };
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = R"({"error":"internal_error","message":"internal server error"})";
        res.prepare_payload();
    }
    do_write(std::move(res));
}

// The request could not be parsed; answer with a fault and close, since the
// rest of the stream cannot be framed.
void Session::reply_to_bad_request(beast::error_code ec) {
    bool too_large = ec == http::error::body_limit || ec == http::error::header_limit;
    Logger::instance().warn("Malformed HTTP request", { {"ec", ec.message()}, {"peer", peer_} });

    nlohmann::json body = { {"error", too_large ? "payload_too_large" : "bad_request"}, {"message", ec.message()} };
    HttpResponse res{ too_large ? http::status::payload_too_large : http::status::bad_request, 11 };
    res.set(http::field::server, "agent-relay");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body.dump();
    res.prepare_payload();
    do_write(std::move(res));
}

void Session::do_write(HttpResponse res) {
    pending_response_ = std::make_shared<HttpResponse>(std::move(res));
    auto self = shared_from_this();
    http::async_write(stream_, *pending_response_, [this, self](beast::error_code ec, std::size_t) {
        if (ec) {
            Logger::instance().info("Session write error/disconnect", { {"ec", ec.message()}, {"peer", peer_} });
            return;
        }
        bool keep_alive = pending_response_->keep_alive();
        pending_response_.reset();
        if (!keep_alive) {
            do_close();
            return;
        }
        do_read();
    });
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Logger::instance().debug("Session shutdown error", { {"ec", ec.message()}, {"peer", peer_} });
}
