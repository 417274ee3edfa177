#pragma once

/// @file ruler.h
/// @brief rulemux ruler service - main orchestration
///
/// Wires the query client, the rule manager and the gRPC and HTTP listeners,
/// and reloads the rule files on request.

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <absl/status/status.h>

#include "query/handlers/handler_base.h"
#include "ruler/ruler_config.h"

namespace grpc {
class Server;
}  // namespace grpc

namespace httplib {
class Server;
}  // namespace httplib

namespace rulemux::query {
class QueryClient;
}  // namespace rulemux::query

namespace rulemux::rules {
class Manager;
}  // namespace rulemux::rules

namespace rulemux::ruler {

class RulesServiceImpl;

/// Main rulemux ruler class
class Ruler {
public:
    /// Create ruler with configuration
    explicit Ruler(RulerConfig config);

    /// Destructor
    ~Ruler();

    // Non-copyable, non-movable
    Ruler(const Ruler&) = delete;
    Ruler& operator=(const Ruler&) = delete;

    /// Start engines and listeners (non-blocking)
    ///
    /// The initial reload is best effort: rule file errors are logged and
    /// the ruler starts with whatever loaded.
    absl::Status Start();

    /// Stop listeners and engines
    absl::Status Shutdown();

    /// Block until shutdown is requested, serving reload requests meanwhile
    void WaitForShutdown();

    /// Request shutdown (non-blocking, signal safe)
    void RequestShutdown();

    /// Request a reload from WaitForShutdown's thread (non-blocking, signal safe)
    void RequestReload();

    /// Expand the rule file patterns and reload the manager
    absl::Status Reload();

    bool IsRunning() const { return running_.load(); }

    /// Get configuration
    const RulerConfig& GetConfig() const { return config_; }

private:
    absl::Status StartGrpcServer();
    absl::Status StartHttpServer();

    RulerConfig config_;

    // Components
    std::unique_ptr<query::QueryClient> query_client_;
    std::unique_ptr<rules::Manager> manager_;
    std::unique_ptr<RulesServiceImpl> rules_service_;
    std::unique_ptr<grpc::Server> grpc_server_;
    std::unique_ptr<httplib::Server> http_server_;
    std::thread http_thread_;
    query::handlers::HandlerRegistry handlers_;

    // State
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> reload_requested_{false};

    // Shutdown coordination
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
};

}  // namespace rulemux::ruler
