#include <reflection/test_descriptors.hpp>

#include <stdexcept>
#include <string_view>
#include <utility>

#include <rpcreflect/compression/gzip.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection::tests {

namespace {

using google::protobuf::DescriptorProto;
using google::protobuf::FieldDescriptorProto;
using google::protobuf::FileDescriptorProto;
using google::protobuf::ServiceDescriptorProto;

constexpr std::string_view kExtendee = ".google.protobuf.MessageOptions";

FileDescriptorProto MakeFile(std::string name, std::string package = {}) {
    FileDescriptorProto file;
    file.set_name(std::move(name));
    if (!package.empty()) {
        file.set_package(std::move(package));
    }
    file.set_syntax("proto2");
    file.add_dependency("google/protobuf/descriptor.proto");
    return file;
}

void AddExtension(google::protobuf::RepeatedPtrField<FieldDescriptorProto>& extensions, std::string name, int number) {
    auto& extension = *extensions.Add();
    extension.set_name(std::move(name));
    extension.set_number(number);
    extension.set_label(FieldDescriptorProto::LABEL_OPTIONAL);
    extension.set_type(FieldDescriptorProto::TYPE_BOOL);
    extension.set_extendee(std::string{kExtendee});
}

void AddService(FileDescriptorProto& file, std::string name, std::string method_name) {
    ServiceDescriptorProto& service = *file.add_service();
    service.set_name(std::move(name));
    auto& method = *service.add_method();
    method.set_name(std::move(method_name));
    method.set_input_type(".Foo");
    method.set_output_type(".Foo");
}

}  // namespace

FileDescriptorProto MainFile() {
    auto file = MakeFile("main.proto");

    DescriptorProto& foo = *file.add_message_type();
    foo.set_name("Foo");
    foo.add_nested_type()->set_name("NestedFoo");
    AddExtension(*foo.mutable_extension(), "isAFoo", 424242);

    AddExtension(*file.mutable_extension(), "attribute", 808080);
    AddService(file, "Bar", "Baz");
    return file;
}

FileDescriptorProto OtherFile() {
    auto file = MakeFile("other.proto");
    AddExtension(*file.mutable_extension(), "attribute", 808081);
    return file;
}

FileDescriptorProto OtherRootMainFile() {
    auto file = MakeFile("main.proto");
    file.add_message_type()->set_name("Qux");
    return file;
}

FileDescriptorProto ConflictExtensionFile() {
    auto file = MakeFile("conflict_extension.proto");
    AddExtension(*file.mutable_extension(), "attribute", 808080);
    return file;
}

FileDescriptorProto ConflictMessageFile() {
    auto file = MakeFile("conflict_message.proto");
    auto& foo = *file.add_message_type();
    foo.set_name("Foo");
    auto& field = *foo.add_field();
    field.set_name("value");
    field.set_number(1);
    field.set_label(FieldDescriptorProto::LABEL_OPTIONAL);
    field.set_type(FieldDescriptorProto::TYPE_STRING);
    return file;
}

FileDescriptorProto ConflictMessageExtensionFile() {
    auto file = MakeFile("conflict_message_extension.proto", "Foo");
    AddExtension(*file.mutable_extension(), "isAFoo", 424242);
    return file;
}

FileDescriptorProto ConflictMessageNestFile() {
    auto file = MakeFile("conflict_message_nest.proto", "Foo");
    file.add_message_type()->set_name("NestedFoo");
    return file;
}

FileDescriptorProto ConflictServiceMethodFile() {
    auto file = MakeFile("conflict_service_method.proto", "Bar");
    AddService(file, "Baz", "Qux");
    return file;
}

FileDescriptorProto ConflictServiceFile() {
    auto file = MakeFile("conflict_service.proto");
    AddService(file, "Bar", "Baz");
    return file;
}

FileDescriptorProto EnumsFile() {
    FileDescriptorProto file;
    file.set_name("enums.proto");
    file.set_package("sample");
    file.set_syntax("proto3");

    auto& color = *file.add_enum_type();
    color.set_name("Color");
    auto& red = *color.add_value();
    red.set_name("COLOR_RED");
    red.set_number(0);

    auto& palette = *file.add_message_type();
    palette.set_name("Palette");
    auto& shade = *palette.add_enum_type();
    shade.set_name("Shade");
    auto& dark = *shade.add_value();
    dark.set_name("SHADE_DARK");
    dark.set_number(0);
    return file;
}

FileDescriptorProto EmptyFile() {
    FileDescriptorProto file;
    file.set_name("empty.proto");
    return file;
}

std::string Serialize(const FileDescriptorProto& file) {
    std::string bytes;
    if (!file.SerializeToString(&bytes)) {
        throw std::runtime_error("Failed to serialize " + file.name());
    }
    return bytes;
}

std::string SerializeCompressed(const FileDescriptorProto& file) { return compression::Compress(Serialize(file)); }

ServiceMeta MakeMeta(std::string service_name, std::initializer_list<FileDescriptorProto> files) {
    ServiceMeta meta;
    meta.service_name = std::move(service_name);
    for (const auto& file : files) {
        meta.file_descriptors.push_back(SerializeCompressed(file));
    }
    return meta;
}

}  // namespace reflection::tests

RPCREFLECT_NAMESPACE_END
