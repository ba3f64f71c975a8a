#pragma once

/// @file rpcreflect/server/exceptions.hpp
/// @brief Errors of server-side streams and of the server setup

#include <stdexcept>
#include <string>
#include <string_view>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

/// @brief Base exception for RPC failures on the server side
class RpcError : public std::runtime_error {
public:
    RpcError(std::string_view call_name, std::string_view additional_info);
};

/// @brief The RPC was cancelled or the connection broke during the given stage
class RpcInterruptedError final : public RpcError {
public:
    RpcInterruptedError(std::string_view call_name, std::string_view stage);
};

/// @brief Static config is missing, malformed or references unusable files
class ConfigError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace server

RPCREFLECT_NAMESPACE_END
