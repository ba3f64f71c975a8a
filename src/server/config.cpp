#include <rpcreflect/server/config.hpp>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <rpcreflect/server/exceptions.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

namespace {

void CheckMap(const YAML::Node& node, std::string_view path, std::initializer_list<std::string_view> properties) {
    if (!node.IsMap()) {
        throw ConfigError(fmt::format("'{}' must be a map", path));
    }
    for (const auto& item : node) {
        const auto key = item.first.as<std::string>();
        if (std::find(properties.begin(), properties.end(), key) == properties.end()) {
            throw ConfigError(fmt::format("Unknown property '{}' at '{}'", key, path));
        }
    }
}

std::string ParseString(const YAML::Node& node, std::string_view path) {
    if (!node.IsScalar()) {
        throw ConfigError(fmt::format("'{}' must be a string", path));
    }
    return node.as<std::string>();
}

LoggingConfig ParseLogging(const YAML::Node& node) {
    LoggingConfig config;
    if (!node) return config;

    CheckMap(node, "logging", {"level", "file"});
    if (const auto level = node["level"]) {
        try {
            config.level = logging::LevelFromString(ParseString(level, "logging.level"));
        } catch (const ConfigError&) {
            throw;
        } catch (const std::runtime_error& ex) {
            throw ConfigError(fmt::format("Bad 'logging.level': {}", ex.what()));
        }
    }
    if (const auto file = node["file"]) {
        config.file = ParseString(file, "logging.file");
    }
    return config;
}

ServiceConfig ParseService(const YAML::Node& node, std::size_t index) {
    const auto path = fmt::format("services[{}]", index);
    CheckMap(node, path, {"name", "descriptor-set"});

    ServiceConfig config;
    if (const auto name = node["name"]) {
        config.name = ParseString(name, path + ".name");
    }
    const auto descriptor_set = node["descriptor-set"];
    if (!descriptor_set) {
        throw ConfigError(fmt::format("Missing required property '{}.descriptor-set'", path));
    }
    config.descriptor_set = ParseString(descriptor_set, path + ".descriptor-set");
    return config;
}

}  // namespace

ServerConfig ParseServerConfig(const YAML::Node& root) {
    ServerConfig config;
    if (!root || root.IsNull()) return config;

    try {
        CheckMap(root, "<root>", {"server", "logging", "services"});

        if (const auto server = root["server"]) {
            CheckMap(server, "server", {"listen-address"});
            if (const auto address = server["listen-address"]) {
                config.listen_address = ParseString(address, "server.listen-address");
            }
        }

        config.logging = ParseLogging(root["logging"]);

        if (const auto services = root["services"]) {
            if (!services.IsSequence()) {
                throw ConfigError("'services' must be a list");
            }
            for (std::size_t i = 0; i < services.size(); ++i) {
                config.services.push_back(ParseService(services[i], i));
            }
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigError(fmt::format("Bad static config: {}", ex.what()));
    }
    return config;
}

ServerConfig LoadServerConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(fmt::format("Failed to load static config '{}': {}", path, ex.what()));
    }
    return ParseServerConfig(root);
}

}  // namespace server

RPCREFLECT_NAMESPACE_END
