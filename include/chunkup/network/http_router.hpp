#pragma once

#include "chunkup/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup {
namespace network {

/**
 * @brief Request context with path parameters and query string split out
 */
struct HttpContext {
    const HttpRequest& request;
    std::string path;                                     // URL without the query string
    std::unordered_map<std::string, std::string> params;  // Path parameters like :id
    std::unordered_map<std::string, std::string> query;   // Decoded ?key=value pairs

    explicit HttpContext(const HttpRequest& req);

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware: return false to short-circuit with the response it filled in
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // Original pattern like "/uploads/:id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method and path based dispatch for the upload endpoints
 *
 * @code
 * HttpRouter router;
 * router.post("/uploads/:id/chunks/:index", [&](const HttpContext& ctx) {
 *     auto index = ctx.get_param("index");
 *     ...
 * });
 * router.use(log_requests);
 * @endcode
 *
 * A path that matches a route under a different method answers 405;
 * no match at all goes to the not-found handler.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers, in registration order
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request
     *
     * A handler that throws produces a 500 with a JSON error body.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
};

// ────────────────────────────────────────────────────────────
// Helper Functions
// ────────────────────────────────────────────────────────────

/**
 * @brief Convert a URL pattern to a regex
 *
 * Converts:
 *   "/uploads/:id"                → "^/uploads/([^/]+)$"
 *   "/uploads/:id/chunks/:index"  → "^/uploads/([^/]+)/chunks/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// Decode %XX escapes and '+' in a URL component
std::string url_decode(const std::string& text);

/// Split "a=1&b=2" into decoded pairs; later duplicates win
std::unordered_map<std::string, std::string> parse_query(const std::string& query);

} // namespace network
} // namespace chunkup
