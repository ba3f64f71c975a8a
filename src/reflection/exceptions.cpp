#include <rpcreflect/reflection/exceptions.hpp>

#include <fmt/format.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

FileConflictError::FileConflictError(
    std::string_view file_name,
    std::string_view service,
    std::string_view baseline_service
)
    : ConflictError(fmt::format(
          "raw filedescriptor for \"{}\" provided by service \"{}\" do not match bytes provided by service \"{}\"",
          file_name,
          service,
          baseline_service
      )),
      file_name_(file_name) {}

SymbolConflictError::SymbolConflictError(std::string_view symbol)
    : ConflictError(fmt::format("symbol name already indexed: \"{}\"", symbol)), symbol_(symbol) {}

ExtensionConflictError::ExtensionConflictError(std::string_view extension, std::int32_t number)
    : ConflictError(fmt::format("extension name and number already indexed: \"{}\" {}", extension, number)),
      extension_(extension),
      number_(number) {}

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
