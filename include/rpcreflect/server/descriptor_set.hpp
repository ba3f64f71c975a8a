#pragma once

/// @file rpcreflect/server/descriptor_set.hpp
/// @brief Service metadata from FileDescriptorSet files

#include <string>
#include <vector>

#include <rpcreflect/reflection/service_meta.hpp>
#include <rpcreflect/server/config.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

/// @brief Reads the configured FileDescriptorSet, every file of the set in set order
/// @throws ConfigError if the file can not be read or is not a FileDescriptorSet
reflection::ServiceMeta LoadServiceMeta(const ServiceConfig& config);

/// @brief LoadServiceMeta for every configured service, in config order
std::vector<reflection::ServiceMeta> LoadServiceMetas(const ServerConfig& config);

}  // namespace server

RPCREFLECT_NAMESPACE_END
