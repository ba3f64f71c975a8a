#pragma once

/// @file rpcreflect/server/config.hpp
/// @brief Static config of the reflection server
///
/// @code{.yaml}
/// server:
///     listen-address: '[::]:8091'
/// logging:
///     level: info
///     file: '@stderr'
/// services:
///   - name: samples.api.GreeterService
///     descriptor-set: /etc/greeter/greeter.desc
/// @endcode

#include <string>
#include <string_view>
#include <vector>

#include <rpcreflect/logging/level.hpp>

namespace YAML {
class Node;
}  // namespace YAML

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

inline constexpr std::string_view kStderrLogFile = "@stderr";

struct ServiceConfig {
    /// Fully-qualified service name, empty for anonymous services
    std::string name;
    /// Path to a binary FileDescriptorSet, as written by `protoc --include_imports --descriptor_set_out`
    std::string descriptor_set;
};

struct LoggingConfig {
    logging::Level level{logging::Level::kInfo};
    /// '@stderr' or a path to append log records to
    std::string file{kStderrLogFile};
};

struct ServerConfig {
    std::string listen_address{"[::]:8091"};
    LoggingConfig logging;
    std::vector<ServiceConfig> services;
};

/// @throws ConfigError on unknown keys, missing required keys or bad values
ServerConfig ParseServerConfig(const YAML::Node& root);

/// @throws ConfigError if the file can not be read or parsed
ServerConfig LoadServerConfig(const std::string& path);

}  // namespace server

RPCREFLECT_NAMESPACE_END
