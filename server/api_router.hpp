// api_router.hpp
#pragma once
#include <map>
#include <string>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "message_store.hpp"
#include "mcp_endpoint.hpp"

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

constexpr size_t kDefaultApiLimit = 200;
constexpr size_t kMaxApiLimit = 500;

// Percent-decoding; '+' becomes a space. Malformed escapes are kept verbatim.
std::string url_decode(const std::string& text);
// "a=1&b=x%20y" -> {a:1, b:"x y"}; later duplicates win.
std::map<std::string, std::string> parse_query(const std::string& query);

// Maps HTTP requests onto the store:
//   GET  /healthz
//   GET  /api/channels
//   GET  /api/messages?target=&since_id=&limit=
//   POST <mcp_path>
class ApiRouter {
public:
    ApiRouter(MessageStore& store, McpEndpoint& mcp, std::string mcp_path);

    HttpResponse handle(const HttpRequest& req);

private:
    HttpResponse api_messages(const HttpRequest& req, const std::map<std::string, std::string>& query);
    HttpResponse api_channels(const HttpRequest& req);
    HttpResponse mcp(const HttpRequest& req);

    MessageStore& store_;
    McpEndpoint& mcp_;
    std::string mcp_path_;
};
