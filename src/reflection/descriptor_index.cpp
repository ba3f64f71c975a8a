#include <reflection/descriptor_index.hpp>

#include <utility>

#include <fmt/format.h>
#include <google/protobuf/descriptor.pb.h>

#include <rpcreflect/compression/gzip.hpp>
#include <rpcreflect/logging/log.hpp>
#include <rpcreflect/reflection/exceptions.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

namespace {

std::string Fqn(std::string_view prefix, std::string_view name) {
    if (prefix.empty()) {
        return std::string{name};
    }
    return fmt::format("{}.{}", prefix, name);
}

struct DecodedFile {
    google::protobuf::FileDescriptorProto proto;
    DescriptorBytes bytes;
};

DecodedFile DecodeFileDescriptor(std::string_view compressed) {
    std::string raw;
    try {
        raw = compression::Decompress(compressed);
    } catch (const compression::DecompressionError& ex) {
        throw DecodeError(fmt::format("failed to decompress descriptor: {}", ex.what()));
    }

    DecodedFile file;
    if (!file.proto.ParseFromString(raw)) {
        throw DecodeError(fmt::format("bad descriptor: failed to parse {}", file.proto.GetTypeName()));
    }
    file.bytes = std::make_shared<const std::string>(std::move(raw));
    return file;
}

bool SameBytes(const DescriptorBytes& lhs, const DescriptorBytes& rhs) { return lhs == rhs || *lhs == *rhs; }

}  // namespace

const std::string* DescriptorIndex::FindFile(std::string_view file_name) const {
    const auto it = files_.find(file_name);
    return it != files_.end() ? it->second.get() : nullptr;
}

const std::string* DescriptorIndex::FindSymbol(std::string_view symbol) const {
    const auto it = symbols_.find(symbol);
    return it != symbols_.end() ? it->second.get() : nullptr;
}

const std::string* DescriptorIndex::FindExtension(std::string_view extension, std::int32_t number) const {
    const auto* numbers = FindExtensionNumbers(extension);
    if (numbers == nullptr) {
        return nullptr;
    }
    const auto it = numbers->find(number);
    return it != numbers->end() ? it->second.get() : nullptr;
}

const DescriptorIndex::ExtensionNumberMap* DescriptorIndex::FindExtensionNumbers(std::string_view extension) const {
    const auto it = extensions_.find(extension);
    return it != extensions_.end() ? &it->second : nullptr;
}

class DescriptorIndexBuilder final {
public:
    void AddMeta(const ServiceMeta& meta) {
        for (const auto& compressed : meta.file_descriptors) {
            auto file = DecodeFileDescriptor(compressed);
            if (RegisterFile(file, meta.service_name)) {
                IndexFile(file.bytes, file.proto);
            }
        }
    }

    DescriptorIndex Extract() && { return std::move(index_); }

private:
    // Returns false if the very same file is already indexed
    bool RegisterFile(const DecodedFile& file, const std::string& service_name) {
        const auto& file_name = file.proto.name();
        const auto [it, inserted] = index_.files_.emplace(file_name, file.bytes);
        if (inserted) {
            file_owners_.emplace(file_name, service_name);
            return true;
        }
        if (!SameBytes(it->second, file.bytes)) {
            throw FileConflictError(file_name, service_name, file_owners_.at(file_name));
        }
        LOG_TRACE() << "File '" << file_name << "' of service '" << service_name << "' is already indexed";
        return false;
    }

    void IndexFile(const DescriptorBytes& bytes, const google::protobuf::FileDescriptorProto& file) {
        const auto& prefix = file.package();
        for (const auto& message : file.message_type()) {
            IndexMessage(bytes, prefix, message);
        }
        for (const auto& enum_type : file.enum_type()) {
            SetSymbol(bytes, Fqn(prefix, enum_type.name()));
        }
        for (const auto& extension : file.extension()) {
            IndexExtension(bytes, prefix, extension);
        }
        for (const auto& service : file.service()) {
            IndexService(bytes, prefix, service);
        }
    }

    void IndexService(
        const DescriptorBytes& bytes,
        std::string_view prefix,
        const google::protobuf::ServiceDescriptorProto& service
    ) {
        const auto service_name = Fqn(prefix, service.name());
        SetSymbol(bytes, service_name);
        for (const auto& method : service.method()) {
            SetSymbol(bytes, Fqn(service_name, method.name()));
        }
    }

    void IndexMessage(
        const DescriptorBytes& bytes,
        std::string_view prefix,
        const google::protobuf::DescriptorProto& message
    ) {
        const auto message_name = Fqn(prefix, message.name());
        SetSymbol(bytes, message_name);

        for (const auto& nested : message.nested_type()) {
            IndexMessage(bytes, message_name, nested);
        }
        for (const auto& enum_type : message.enum_type()) {
            SetSymbol(bytes, Fqn(message_name, enum_type.name()));
        }
        for (const auto& extension : message.extension()) {
            IndexExtension(bytes, message_name, extension);
        }
    }

    // Extensions are keyed by the scope-qualified name of the extension field
    void IndexExtension(
        const DescriptorBytes& bytes,
        std::string_view prefix,
        const google::protobuf::FieldDescriptorProto& extension
    ) {
        auto name = Fqn(prefix, extension.name());
        const auto number = extension.number();
        auto& numbers = index_.extensions_[name];
        const auto [it, inserted] = numbers.emplace(number, bytes);
        if (!inserted && !SameBytes(it->second, bytes)) {
            throw ExtensionConflictError(name, number);
        }
    }

    void SetSymbol(const DescriptorBytes& bytes, std::string symbol) {
        const auto [it, inserted] = index_.symbols_.emplace(std::move(symbol), bytes);
        if (!inserted && !SameBytes(it->second, bytes)) {
            throw SymbolConflictError(it->first);
        }
    }

    DescriptorIndex index_;
    std::map<std::string, std::string, std::less<>> file_owners_;
};

IndexedMetas IndexServiceMetas(const std::vector<ServiceMeta>& metas) {
    IndexedMetas result;
    result.service_names.reserve(metas.size());

    DescriptorIndexBuilder builder;
    for (const auto& meta : metas) {
        result.service_names.push_back(meta.service_name);
        builder.AddMeta(meta);
    }
    result.index = std::move(builder).Extract();

    LOG_INFO() << "Indexed " << result.index.GetFiles().size() << " files, " << result.index.GetSymbols().size()
               << " symbols and " << result.index.GetExtensions().size() << " extended types of "
               << result.service_names.size() << " services";
    return result;
}

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
