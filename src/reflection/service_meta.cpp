#include <rpcreflect/reflection/service_meta.hpp>

#include <stdexcept>
#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>

#include <rpcreflect/compression/gzip.hpp>

#include <reflection.pb.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

namespace {

void CollectFileDescriptors(
    const google::protobuf::FileDescriptor& file_desc,
    std::vector<std::string>& file_descriptors,
    std::unordered_set<std::string>& seen_files
) {
    if (!seen_files.insert(std::string{file_desc.name()}).second) {
        return;
    }

    google::protobuf::FileDescriptorProto file_desc_proto;
    std::string data;
    file_desc.CopyTo(&file_desc_proto);
    if (!file_desc_proto.SerializeToString(&data)) {
        throw std::runtime_error(fmt::format("Failed to serialize descriptor of '{}'", file_desc.name()));
    }
    file_descriptors.push_back(compression::Compress(data));

    for (int i = 0; i < file_desc.dependency_count(); ++i) {
        CollectFileDescriptors(*file_desc.dependency(i), file_descriptors, seen_files);
    }
}

}  // namespace

ServiceMeta MakeServiceMeta(const google::protobuf::ServiceDescriptor& service) {
    ServiceMeta meta;
    meta.service_name = service.full_name();
    std::unordered_set<std::string> seen_files;
    CollectFileDescriptors(*service.file(), meta.file_descriptors, seen_files);
    return meta;
}

const ServiceMeta& GetReflectionServiceMeta() {
    static const ServiceMeta kMeta = [] {
        const auto* file = grpc::reflection::v1alpha::ServerReflectionRequest::descriptor()->file();
        const auto* service = file->FindServiceByName("ServerReflection");
        if (service == nullptr) {
            throw std::logic_error("ServerReflection is missing from the generated reflection descriptor");
        }
        return MakeServiceMeta(*service);
    }();
    return kMeta;
}

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
