#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rpcreflect/reflection/service_meta.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

/// Decompressed serialized FileDescriptorProto, shared by every key its file declares
using DescriptorBytes = std::shared_ptr<const std::string>;

/// @brief Immutable lookup of schema files by file name, symbol and extension number
///
/// Keys map to the bytes of the descriptor that declared them first. Built only by
/// IndexServiceMetas, never modified afterwards, so concurrent reads need no locking.
class DescriptorIndex final {
public:
    using FileMap = std::map<std::string, DescriptorBytes, std::less<>>;
    using SymbolMap = std::map<std::string, DescriptorBytes, std::less<>>;
    using ExtensionNumberMap = std::map<std::int32_t, DescriptorBytes>;
    using ExtensionMap = std::map<std::string, ExtensionNumberMap, std::less<>>;

    DescriptorIndex() = default;

    /// @returns nullptr if no file with such a name was indexed
    const std::string* FindFile(std::string_view file_name) const;

    /// @returns nullptr if no file declares the fully-qualified symbol
    const std::string* FindSymbol(std::string_view symbol) const;

    /// @returns nullptr if no file declares the extension with such a number
    const std::string* FindExtension(std::string_view extension, std::int32_t number) const;

    /// @returns ascending extension numbers, or nullptr if nothing extends the type
    const ExtensionNumberMap* FindExtensionNumbers(std::string_view extension) const;

    const FileMap& GetFiles() const noexcept { return files_; }
    const SymbolMap& GetSymbols() const noexcept { return symbols_; }
    const ExtensionMap& GetExtensions() const noexcept { return extensions_; }

private:
    friend class DescriptorIndexBuilder;

    FileMap files_;
    SymbolMap symbols_;
    ExtensionMap extensions_;
};

struct IndexedMetas {
    /// Service names in the order of the metas, empty names included
    std::vector<std::string> service_names;
    DescriptorIndex index;
};

/// @brief Decodes every descriptor of every meta and indexes it, all or nothing
///
/// Earlier metas win: a later declaration of an already indexed key must carry
/// byte-identical descriptor contents.
/// @throws DecodeError, FileConflictError, SymbolConflictError, ExtensionConflictError
IndexedMetas IndexServiceMetas(const std::vector<ServiceMeta>& metas);

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
