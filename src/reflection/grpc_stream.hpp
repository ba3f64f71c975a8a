#pragma once

#include <string>
#include <utility>

#include <grpcpp/server_context.h>
#include <grpcpp/support/sync_stream.h>

#include <rpcreflect/server/exceptions.hpp>
#include <rpcreflect/server/stream.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

/// @brief server::BidirectionalStream over a synchronous gRPC server stream
///
/// gRPC reports a half-closed and a cancelled stream alike by a failed Read,
/// the call context tells them apart.
template <typename Request, typename Response>
class GrpcBidirectionalStream final : public server::BidirectionalStream<Request, Response> {
public:
    GrpcBidirectionalStream(
        std::string call_name,
        grpc::ServerContext& context,
        grpc::ServerReaderWriterInterface<Response, Request>& stream
    )
        : call_name_(std::move(call_name)), context_(context), stream_(stream) {}

    bool Read(Request& request) override {
        if (stream_.Read(&request)) {
            return true;
        }
        if (context_.IsCancelled()) {
            throw server::RpcInterruptedError(call_name_, "Read");
        }
        return false;
    }

    void Write(const Response& response) override {
        if (!stream_.Write(response)) {
            throw server::RpcInterruptedError(call_name_, "Write");
        }
    }

private:
    const std::string call_name_;
    grpc::ServerContext& context_;
    grpc::ServerReaderWriterInterface<Response, Request>& stream_;
};

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
