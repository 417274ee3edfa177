#pragma once

/// @file handler_base.h
/// @brief Base handler interface for the HTTP API

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace rulemux::query::handlers {

/// @brief HTTP method enum
enum class HttpMethod {
    kGet,
    kPost,
    kPut,
    kDelete,
    kPatch
};

/// @brief HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::kGet;
    std::string path;
    std::unordered_map<std::string, std::string> query_params;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

/// @brief HTTP response
///
/// Bodies follow the Prometheus API envelope:
/// {"status":"success","data":...} or
/// {"status":"error","errorType":...,"error":...}.
struct HttpResponse {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse Ok(const nlohmann::json& data) {
        HttpResponse resp;
        resp.status_code = 200;
        resp.body = nlohmann::json{{"status", "success"}, {"data", data}}.dump();
        return resp;
    }

    static HttpResponse Error(int status_code, const std::string& error_type,
                              const std::string& message) {
        HttpResponse resp;
        resp.status_code = status_code;
        resp.body = nlohmann::json{
            {"status", "error"}, {"errorType", error_type}, {"error", message}}.dump();
        return resp;
    }

    static HttpResponse BadRequest(const std::string& message) {
        return Error(400, "bad_data", message);
    }

    static HttpResponse NotFound(const std::string& message = "Not found") {
        return Error(404, "not_found", message);
    }

    static HttpResponse InternalError(const std::string& message) {
        return Error(500, "internal", message);
    }

    static HttpResponse Unavailable(const std::string& message) {
        return Error(503, "unavailable", message);
    }
};

/// @brief Base handler interface
class Handler {
public:
    virtual ~Handler() = default;

    /// @brief Handle the request
    virtual HttpResponse Handle(const HttpRequest& request) = 0;

    /// @brief Get the route pattern (e.g., "/api/v1/rules")
    virtual std::string GetRoute() const = 0;

    /// @brief Get supported HTTP methods
    virtual std::vector<HttpMethod> GetMethods() const = 0;

protected:
    /// @brief Query parameter or `default_value` if absent
    static std::string QueryParam(const HttpRequest& request, const std::string& key,
                                  const std::string& default_value = "") {
        auto it = request.query_params.find(key);
        if (it == request.query_params.end()) {
            return default_value;
        }
        return it->second;
    }
};

/// @brief Register all handlers with the router
class HandlerRegistry {
public:
    void Register(std::unique_ptr<Handler> handler) {
        handlers_.push_back(std::move(handler));
    }

    const std::vector<std::unique_ptr<Handler>>& GetHandlers() const {
        return handlers_;
    }

private:
    std::vector<std::unique_ptr<Handler>> handlers_;
};

}  // namespace rulemux::query::handlers
