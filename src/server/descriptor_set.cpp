#include <rpcreflect/server/descriptor_set.hpp>

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <google/protobuf/descriptor.pb.h>

#include <rpcreflect/compression/gzip.hpp>
#include <rpcreflect/logging/log.hpp>
#include <rpcreflect/server/exceptions.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream input{path, std::ios::binary};
    if (!input) {
        throw ConfigError(fmt::format("Failed to open descriptor set '{}'", path));
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        throw ConfigError(fmt::format("Failed to read descriptor set '{}'", path));
    }
    return contents.str();
}

}  // namespace

reflection::ServiceMeta LoadServiceMeta(const ServiceConfig& config) {
    google::protobuf::FileDescriptorSet descriptor_set;
    if (!descriptor_set.ParseFromString(ReadFile(config.descriptor_set))) {
        throw ConfigError(fmt::format("'{}' is not a serialized FileDescriptorSet", config.descriptor_set));
    }

    reflection::ServiceMeta meta;
    meta.service_name = config.name;
    meta.file_descriptors.reserve(descriptor_set.file_size());
    for (const auto& file : descriptor_set.file()) {
        std::string data;
        if (!file.SerializeToString(&data)) {
            throw ConfigError(
                fmt::format("Failed to serialize '{}' from descriptor set '{}'", file.name(), config.descriptor_set)
            );
        }
        meta.file_descriptors.push_back(compression::Compress(data));
    }

    LOG_DEBUG() << "Loaded " << meta.file_descriptors.size() << " files of service '" << meta.service_name
                << "' from " << config.descriptor_set;
    return meta;
}

std::vector<reflection::ServiceMeta> LoadServiceMetas(const ServerConfig& config) {
    std::vector<reflection::ServiceMeta> metas;
    metas.reserve(config.services.size());
    for (const auto& service : config.services) {
        metas.push_back(LoadServiceMeta(service));
    }
    return metas;
}

}  // namespace server

RPCREFLECT_NAMESPACE_END
