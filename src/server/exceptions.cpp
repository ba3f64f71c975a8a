#include <rpcreflect/server/exceptions.hpp>

#include <fmt/format.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

RpcError::RpcError(std::string_view call_name, std::string_view additional_info)
    : std::runtime_error(fmt::format("'{}' failed: {}", call_name, additional_info)) {}

RpcInterruptedError::RpcInterruptedError(std::string_view call_name, std::string_view stage)
    : RpcError(call_name, fmt::format("interrupted at '{}'", stage)) {}

}  // namespace server

RPCREFLECT_NAMESPACE_END
