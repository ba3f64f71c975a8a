#pragma once

/// @file rpcreflect/reflection/reflection_service.hpp
/// @brief gRPC service answering grpc.reflection.v1alpha.ServerReflection queries

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>
#include <grpcpp/support/sync_stream.h>

#include <rpcreflect/reflection/service_meta.hpp>

#include <reflection.grpc.pb.h>

RPCREFLECT_NAMESPACE_BEGIN

/// @brief Top namespace for the server reflection library
namespace reflection {

class ProtoServerReflection;

/// @brief Reflection service over the schemas of a fixed set of services
///
/// Register it on a grpc::ServerBuilder like any other service. The set of
/// services is frozen at construction.
class ReflectionService final : public grpc::reflection::v1alpha::ServerReflection::Service {
public:
    /// @throws IndexBuildError if the metas can not be decoded or conflict with each other
    explicit ReflectionService(std::vector<ServiceMeta> metas);

    ~ReflectionService() override;

    grpc::Status ServerReflectionInfo(
        grpc::ServerContext* context,
        grpc::ServerReaderWriter<
            grpc::reflection::v1alpha::ServerReflectionResponse,
            grpc::reflection::v1alpha::ServerReflectionRequest>* stream
    ) override;

    /// Names of the described services, the reflection service included
    const std::vector<std::string>& GetServiceNames() const noexcept;

private:
    std::unique_ptr<ProtoServerReflection> service_;
};

/// @brief Builds the reflection service, its own metadata is appended to `metas`
/// @throws IndexBuildError
std::unique_ptr<ReflectionService> MakeReflectionService(std::vector<ServiceMeta> metas);

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
