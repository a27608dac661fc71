#include "chunkup/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace chunkup {
namespace network {

// ────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\' || c == '*') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

std::string url_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            decoded += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
    std::unordered_map<std::string, std::string> pairs;
    std::istringstream stream(query);
    std::string item;

    while (std::getline(stream, item, '&')) {
        if (item.empty()) {
            continue;
        }
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            pairs[url_decode(item)] = "";
        } else {
            pairs[url_decode(item.substr(0, eq))] = url_decode(item.substr(eq + 1));
        }
    }
    return pairs;
}

HttpContext::HttpContext(const HttpRequest& req) : request(req) {
    auto question = req.url.find('?');
    if (question == std::string::npos) {
        path = req.url;
    } else {
        path = req.url.substr(0, question);
        query = parse_query(req.url.substr(question + 1));
    }
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = url_decode(match[i + 1].str());
        }
    }
    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

namespace {

HttpResponse json_error(HttpStatus status, const std::string& code, const std::string& message) {
    HttpResponse response(status);
    nlohmann::json body = {{"error", message}, {"code", code}};
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const Route* route = nullptr;
    bool path_known = false;
    for (const auto& candidate : routes_) {
        if (!candidate.matches_path(ctx.path)) {
            continue;
        }
        path_known = true;
        if (candidate.method == request.method) {
            route = &candidate;
            break;
        }
    }

    if (route == nullptr) {
        if (path_known) {
            return json_error(HttpStatus::METHOD_NOT_ALLOWED, "bad_request",
                              "Method " + HttpMethodUtils::to_string(request.method) +
                              " not allowed on " + ctx.path);
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(ctx.path);
    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw exception: {}", route->pattern, e.what());
        response = json_error(HttpStatus::INTERNAL_SERVER_ERROR, "internal", e.what());
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return json_error(HttpStatus::NOT_FOUND, "not_found", "No route for " + ctx.path);
}

} // namespace network
} // namespace chunkup
