// api_router.cpp
#include "api_router.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include "logger.hpp"
#include "wire_integer.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

HttpResponse make_response(const HttpRequest& req, http::status status, std::string body,
                           const char* content_type = "application/json") {
    HttpResponse res{ status, req.version() };
    res.set(http::field::server, "agent-relay");
    res.set(http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

HttpResponse json_response(const HttpRequest& req, http::status status, const json& j) {
    return make_response(req, status, j.dump(-1, ' ', false, json::error_handler_t::replace));
}

HttpResponse error_response(const HttpRequest& req, http::status status, const std::string& kind, const std::string& message) {
    return json_response(req, status, { {"error", kind}, {"message", message} });
}

// Non-negative integer query value; negative numbers clamp to 0, values past
// uint64 saturate.
uint64_t query_integer(const std::map<std::string, std::string>& query, const std::string& key, uint64_t fallback) {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) return fallback;
    auto v = parse_saturating_uint(it->second);
    if (!v) throw ValidationError(key + " must be an integer");
    return *v;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> out;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) out[url_decode(pair)] = "";
            else out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return out;
}

ApiRouter::ApiRouter(MessageStore& store, McpEndpoint& mcp, std::string mcp_path)
    : store_(store), mcp_(mcp), mcp_path_(std::move(mcp_path)) {}

HttpResponse ApiRouter::handle(const HttpRequest& req) {
    std::string target(req.target());
    std::string path = target;
    std::string query;
    auto qpos = target.find('?');
    if (qpos != std::string::npos) {
        path = target.substr(0, qpos);
        query = target.substr(qpos + 1);
    }
    Logger::instance().debug("HTTP request", { {"method", std::string(req.method_string())}, {"target", target} });

    if (path == mcp_path_ || path == mcp_path_ + "/") return mcp(req);

    if (req.method() != http::verb::get) {
        if (path == "/healthz" || path == "/api/messages" || path == "/api/channels")
            return error_response(req, http::status::method_not_allowed, "method_not_allowed", "only GET is supported");
        return error_response(req, http::status::not_found, "not_found", "no route for " + path);
    }

    if (path == "/healthz") return make_response(req, http::status::ok, "ok", "text/plain");
    if (path == "/api/channels") return api_channels(req);
    if (path == "/api/messages") {
        try {
            return api_messages(req, parse_query(query));
        } catch (const ValidationError& ex) {
            return error_response(req, http::status::bad_request, ex.kind_name(), ex.what());
        } catch (const NotFoundError& ex) {
            return error_response(req, http::status::not_found, ex.kind_name(), ex.what());
        }
    }
    return error_response(req, http::status::not_found, "not_found", "no route for " + path);
}

HttpResponse ApiRouter::api_messages(const HttpRequest& req, const std::map<std::string, std::string>& query) {
    auto target_it = query.find("target");
    if (target_it == query.end() || target_it->second.empty()) throw ValidationError("target is required");
    const std::string& channel = target_it->second;

    size_t limit = static_cast<size_t>(std::clamp<uint64_t>(query_integer(query, "limit", kDefaultApiLimit), 1, kMaxApiLimit));
    auto since_it = query.find("since_id");
    bool incremental = since_it != query.end() && !since_it->second.empty();
    uint64_t since_id = incremental ? query_integer(query, "since_id", 0) : 0;

    // without since_id the page shows the newest messages
    std::vector<Message> messages = incremental ? store_.fetch_messages(channel, since_id, limit)
                                                : store_.recent_messages(channel, limit);
    json out = json::array();
    for (const auto& m : messages) out.push_back(message_to_json(m));
    uint64_t latest = messages.empty() ? since_id : messages.back().id;
    return json_response(req, http::status::ok, { {"target", channel}, {"messages", out}, {"latest_id", latest} });
}

HttpResponse ApiRouter::api_channels(const HttpRequest& req) {
    return json_response(req, http::status::ok, { {"channels", store_.list_channels()} });
}

HttpResponse ApiRouter::mcp(const HttpRequest& req) {
    if (req.method() != http::verb::post) {
        HttpResponse res = error_response(req, http::status::method_not_allowed, "method_not_allowed",
                                          "this endpoint answers JSON-RPC over POST only");
        res.set(http::field::allow, "POST");
        return res;
    }
    McpReply reply = mcp_.handle(req.body());
    HttpResponse res = make_response(req, static_cast<http::status>(reply.status), std::move(reply.body));
    if (!reply.session_id.empty()) res.set("Mcp-Session-Id", reply.session_id);
    return res;
}
