#pragma once

/// @file rules_service.h
/// @brief gRPC Rules service backed by the rule manager

#include <absl/status/status.h>
#include <grpcpp/grpcpp.h>

#include "proto/rulemux/v1/rules.grpc.pb.h"
#include "rules/manager.h"

namespace rulemux::ruler {

/// @brief Server-streaming Rules endpoint
///
/// One RulesResponse per group. A rule of unsupported type ends the call
/// with INTERNAL; a failed write or a cancelled call ends it early.
class RulesServiceImpl final : public v1::Rules::Service {
public:
    explicit RulesServiceImpl(const rules::Manager& manager);

    grpc::Status Rules(grpc::ServerContext* context, const v1::RulesRequest* request,
                       grpc::ServerWriter<v1::RulesResponse>* writer) override;

private:
    const rules::Manager& manager_;
};

/// @brief Map an absl::Status onto the matching grpc::Status
grpc::Status ToGrpcStatus(const absl::Status& status);

}  // namespace rulemux::ruler
