/// @file ruler.cpp
/// @brief Ruler service implementation

#include "ruler/ruler.h"

#include <chrono>

#include <absl/strings/str_cat.h>
#include <grpcpp/grpcpp.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/logging.h"
#include "common/metrics.h"
#include "query/handlers/rules_handler.h"
#include "query/query_client.h"
#include "rules/local_engine.h"
#include "rules/manager.h"
#include "ruler/rules_service.h"

namespace rulemux::ruler {

namespace {

query::handlers::HttpRequest ToHandlerRequest(const httplib::Request& req) {
    query::handlers::HttpRequest request;
    request.method = req.method == "POST" ? query::handlers::HttpMethod::kPost
                                          : query::handlers::HttpMethod::kGet;
    request.path = req.path;
    for (const auto& [key, value] : req.params) {
        request.query_params[key] = value;
    }
    for (const auto& [key, value] : req.headers) {
        request.headers[key] = value;
    }
    request.body = req.body;
    return request;
}

}  // namespace

Ruler::Ruler(RulerConfig config) : config_(std::move(config)) {}

Ruler::~Ruler() {
    if (running_.load()) {
        auto status = Shutdown();
        if (!status.ok()) {
            RULEMUX_LOG_ERROR("Error during shutdown: {}", std::string_view(status.message().data(), status.message().size()));
        }
    }
}

absl::Status Ruler::Start() {
    if (running_.exchange(true)) {
        return absl::AlreadyExistsError("Ruler already running");
    }

    RULEMUX_LOG_INFO("Starting ruler, data_dir={}, eval_interval={}ms",
                     config_.data_dir.string(), config_.eval_interval.count());

    query_client_ = std::make_unique<query::QueryClient>(
        query::QueryClientConfig{config_.query.endpoints, config_.query.timeout});

    rules::ManagerOptions options;
    options.data_dir = config_.data_dir;
    options.registry = &MetricsRegistry::Instance();
    manager_ = std::make_unique<rules::Manager>(
        std::move(options),
        [this](rules::Strategy strategy) { return query_client_->QueryFuncFor(strategy); },
        &rules::LocalEngine::Create);

    auto status = Reload();
    if (!status.ok()) {
        RULEMUX_LOG_WARN("Initial rule load incomplete: {}", std::string_view(status.message().data(), status.message().size()));
    }
    manager_->Run();

    status = StartGrpcServer();
    if (!status.ok()) {
        running_ = false;
        manager_->Stop();
        return status;
    }

    status = StartHttpServer();
    if (!status.ok()) {
        running_ = false;
        grpc_server_->Shutdown();
        manager_->Stop();
        return status;
    }

    RULEMUX_LOG_INFO("Ruler started");
    return absl::OkStatus();
}

absl::Status Ruler::Shutdown() {
    if (!running_.exchange(false)) {
        return absl::FailedPreconditionError("Ruler not running");
    }

    RULEMUX_LOG_INFO("Shutting down ruler...");

    if (http_server_) {
        http_server_->stop();
    }
    if (http_thread_.joinable()) {
        http_thread_.join();
    }
    if (grpc_server_) {
        grpc_server_->Shutdown();
        grpc_server_.reset();
    }
    if (manager_) {
        manager_->Stop();
    }

    RULEMUX_LOG_INFO("Ruler shutdown complete");
    return absl::OkStatus();
}

void Ruler::WaitForShutdown() {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    while (!shutdown_requested_.load()) {
        // Flags are set from signal handlers, so poll rather than rely on notify.
        shutdown_cv_.wait_for(lock, std::chrono::milliseconds(200), [this] {
            return shutdown_requested_.load() || reload_requested_.load();
        });
        if (reload_requested_.exchange(false)) {
            lock.unlock();
            auto status = Reload();
            if (!status.ok()) {
                RULEMUX_LOG_ERROR("Reload failed: {}", std::string_view(status.message().data(), status.message().size()));
            }
            lock.lock();
        }
    }
}

void Ruler::RequestShutdown() {
    shutdown_requested_ = true;
}

void Ruler::RequestReload() {
    reload_requested_ = true;
}

absl::Status Ruler::Reload() {
    if (!manager_) {
        return absl::FailedPreconditionError("Ruler not started");
    }
    auto files = ExpandRuleFiles(config_.rule_files);
    if (!files.ok()) {
        return files.status();
    }
    RULEMUX_LOG_INFO("Reloading {} rule files", files->size());
    return manager_->Update(config_.eval_interval, *files);
}

absl::Status Ruler::StartGrpcServer() {
    rules_service_ = std::make_unique<RulesServiceImpl>(*manager_);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config_.grpc.address, grpc::InsecureServerCredentials());
    builder.RegisterService(rules_service_.get());

    grpc_server_ = builder.BuildAndStart();
    if (!grpc_server_) {
        return absl::InternalError(
            absl::StrCat("Failed to start gRPC server on ", config_.grpc.address));
    }

    RULEMUX_LOG_INFO("gRPC server listening on {}", config_.grpc.address);
    return absl::OkStatus();
}

absl::Status Ruler::StartHttpServer() {
    std::string host = "0.0.0.0";
    int port = 10902;
    const auto colon_pos = config_.http.address.rfind(':');
    if (colon_pos == std::string::npos) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid HTTP address: ", config_.http.address));
    }
    host = config_.http.address.substr(0, colon_pos);
    try {
        port = std::stoi(config_.http.address.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid port in HTTP address ", config_.http.address));
    }

    http_server_ = std::make_unique<httplib::Server>();

    handlers_.Register(std::make_unique<query::handlers::RulesHandler>(*manager_));
    handlers_.Register(std::make_unique<query::handlers::AlertsHandler>(*manager_));
    for (const auto& handler : handlers_.GetHandlers()) {
        auto* h = handler.get();
        http_server_->Get(h->GetRoute(), [h](const httplib::Request& req,
                                              httplib::Response& res) {
            auto response = h->Handle(ToHandlerRequest(req));
            res.status = response.status_code;
            for (const auto& [key, value] : response.headers) {
                res.set_header(key, value);
            }
            res.set_content(response.body, response.content_type.c_str());
        });
    }

    http_server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(MetricsRegistry::Instance().ExportText(),
                        "text/plain; version=0.0.4");
    });

    http_server_->Get("/-/healthy", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });

    http_server_->Post("/-/reload", [this](const httplib::Request&, httplib::Response& res) {
        auto status = Reload();
        if (!status.ok()) {
            res.status = 500;
            res.set_content(nlohmann::json{{"error", std::string(status.message())}}.dump(),
                            "application/json");
            return;
        }
        res.set_content("{}", "application/json");
    });

    if (!http_server_->bind_to_port(host.c_str(), port)) {
        return absl::UnavailableError(
            absl::StrCat("Failed to bind HTTP server to ", config_.http.address));
    }
    http_thread_ = std::thread([this] { http_server_->listen_after_bind(); });

    RULEMUX_LOG_INFO("HTTP server listening on {}", config_.http.address);
    return absl::OkStatus();
}

}  // namespace rulemux::ruler
