#pragma once

/// @file rpcreflect/reflection/service_meta.hpp
/// @brief Per-service schema metadata consumed by the reflection service

#include <string>
#include <string_view>
#include <vector>

namespace google::protobuf {
class ServiceDescriptor;
}  // namespace google::protobuf

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

/// Full name of the reflection service itself
inline constexpr std::string_view kReflectionServiceName = "grpc.reflection.v1alpha.ServerReflection";

/// @brief Schema metadata of a single registered service
struct ServiceMeta {
    /// Fully-qualified service name, may be empty for anonymous registrations
    std::string service_name;

    /// gzip-compressed serialized google.protobuf.FileDescriptorProto of the file
    /// declaring the service and of every file it transitively depends on
    std::vector<std::string> file_descriptors;
};

/// @brief Collects the metadata of a service compiled into the binary
///
/// Files are listed dependents first, every file once.
ServiceMeta MakeServiceMeta(const google::protobuf::ServiceDescriptor& service);

/// @brief Metadata describing grpc.reflection.v1alpha.ServerReflection, generated by protoc at build time
const ServiceMeta& GetReflectionServiceMeta();

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
