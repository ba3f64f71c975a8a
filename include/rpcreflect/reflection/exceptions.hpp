#pragma once

/// @file rpcreflect/reflection/exceptions.hpp
/// @brief Errors of the descriptor index construction

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

/// @brief Base class for all errors that abort building the descriptor index
class IndexBuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief A descriptor blob is not gzip data or does not hold a FileDescriptorProto
class DecodeError final : public IndexBuildError {
public:
    using IndexBuildError::IndexBuildError;
};

/// @brief The same key is declared by two descriptors with different contents
class ConflictError : public IndexBuildError {
public:
    using IndexBuildError::IndexBuildError;
};

class FileConflictError final : public ConflictError {
public:
    FileConflictError(std::string_view file_name, std::string_view service, std::string_view baseline_service);

    const std::string& GetFileName() const noexcept { return file_name_; }

private:
    std::string file_name_;
};

class SymbolConflictError final : public ConflictError {
public:
    explicit SymbolConflictError(std::string_view symbol);

    const std::string& GetSymbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

class ExtensionConflictError final : public ConflictError {
public:
    ExtensionConflictError(std::string_view extension, std::int32_t number);

    const std::string& GetExtension() const noexcept { return extension_; }

    std::int32_t GetNumber() const noexcept { return number_; }

private:
    std::string extension_;
    std::int32_t number_;
};

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
