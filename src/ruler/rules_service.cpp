/// @file rules_service.cpp
/// @brief gRPC Rules service implementation

#include "ruler/rules_service.h"

#include <stdexcept>
#include <string>

#include "common/error.h"
#include "common/logging.h"

namespace rulemux::ruler {

namespace {

/// Feeds a listing into a gRPC server writer
class ServerWriterStream : public rules::RulesStream {
public:
    ServerWriterStream(grpc::ServerContext* context,
                       grpc::ServerWriter<v1::RulesResponse>* writer)
        : context_(context), writer_(writer) {}

    absl::Status Send(const v1::RulesResponse& response) override {
        if (!writer_->Write(response)) {
            return MakeError(ErrorCode::kUnavailable, "sending rules response failed");
        }
        return absl::OkStatus();
    }

    bool IsCancelled() const override { return context_->IsCancelled(); }

private:
    grpc::ServerContext* context_;
    grpc::ServerWriter<v1::RulesResponse>* writer_;
};

}  // namespace

RulesServiceImpl::RulesServiceImpl(const rules::Manager& manager) : manager_(manager) {}

grpc::Status RulesServiceImpl::Rules(grpc::ServerContext* context,
                                     const v1::RulesRequest* request,
                                     grpc::ServerWriter<v1::RulesResponse>* writer) {
    ServerWriterStream stream(context, writer);
    try {
        auto status = manager_.Rules(*request, stream);
        if (!status.ok()) {
            RULEMUX_LOG_DEBUG("Rules stream to {} ended: {}", context->peer(),
                              status.message());
        }
        return ToGrpcStatus(status);
    } catch (const std::logic_error& e) {
        RULEMUX_LOG_ERROR("Rules stream to {} failed: {}", context->peer(), e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status ToGrpcStatus(const absl::Status& status) {
    if (status.ok()) {
        return grpc::Status::OK;
    }
    // absl and gRPC share the canonical code numbering.
    return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
                        std::string(status.message()));
}

}  // namespace rulemux::ruler
