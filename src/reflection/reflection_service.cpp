#include <rpcreflect/reflection/reflection_service.hpp>

#include <string>
#include <utility>

#include <rpcreflect/logging/log.hpp>
#include <rpcreflect/server/exceptions.hpp>

#include <reflection/grpc_stream.hpp>
#include <reflection/proto_server_reflection.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

namespace {

constexpr std::string_view kCallName = "grpc.reflection.v1alpha.ServerReflection/ServerReflectionInfo";

}  // namespace

ReflectionService::ReflectionService(std::vector<ServiceMeta> metas)
    : service_(ProtoServerReflection::Create(std::move(metas))) {
    LOG_INFO() << "Reflection service describes " << service_->GetServiceNames().size() << " services";
}

ReflectionService::~ReflectionService() = default;

grpc::Status ReflectionService::ServerReflectionInfo(
    grpc::ServerContext* context,
    grpc::ServerReaderWriter<
        grpc::reflection::v1alpha::ServerReflectionResponse,
        grpc::reflection::v1alpha::ServerReflectionRequest>* stream
) {
    GrpcBidirectionalStream<
        grpc::reflection::v1alpha::ServerReflectionRequest,
        grpc::reflection::v1alpha::ServerReflectionResponse>
        reader_writer{std::string{kCallName}, *context, *stream};

    try {
        return service_->ServerReflectionInfo(reader_writer);
    } catch (const server::RpcInterruptedError& ex) {
        LOG_WARNING() << ex.what();
        return grpc::Status(grpc::StatusCode::CANCELLED, ex.what());
    }
}

const std::vector<std::string>& ReflectionService::GetServiceNames() const noexcept {
    return service_->GetServiceNames();
}

std::unique_ptr<ReflectionService> MakeReflectionService(std::vector<ServiceMeta> metas) {
    return std::make_unique<ReflectionService>(std::move(metas));
}

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
