/*
 *
 * Copyright 2016 gRPC authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */
/* Code was modified by rpcreflect developers
 * based on
 * https://github.com/grpc/grpc/blob/0f9d024fec6a96cfa07ebae633e3ee96c933d3c4/src/cpp/ext/proto_server_reflection.cc
 */

#include <reflection/proto_server_reflection.hpp>

#include <utility>

#include <fmt/format.h>

#include <rpcreflect/logging/log.hpp>

namespace proto_reflection = grpc::reflection::v1alpha;

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

namespace {

grpc::Status NotFound(std::string message) { return grpc::Status(grpc::StatusCode::NOT_FOUND, std::move(message)); }

}  // namespace

ProtoServerReflection::ProtoServerReflection(std::vector<std::string> service_names, DescriptorIndex index)
    : service_names_(std::move(service_names)), index_(std::move(index)) {}

std::unique_ptr<ProtoServerReflection> ProtoServerReflection::Create(std::vector<ServiceMeta> metas) {
    metas.push_back(GetReflectionServiceMeta());
    auto indexed = IndexServiceMetas(metas);
    return std::make_unique<ProtoServerReflection>(std::move(indexed.service_names), std::move(indexed.index));
}

grpc::Status ProtoServerReflection::ServerReflectionInfo(ServerReflectionInfoReaderWriter& stream) const {
    Request request;
    while (stream.Read(request)) {
        LOG_DEBUG() << "Reflection request: " << request.ShortDebugString();

        Response response;
        grpc::Status status;
        switch (request.message_request_case()) {
            case Request::MessageRequestCase::kFileByFilename:
                status = GetFileByName(request.file_by_filename(), response);
                break;
            case Request::MessageRequestCase::kFileContainingSymbol:
                status = GetFileContainingSymbol(request.file_containing_symbol(), response);
                break;
            case Request::MessageRequestCase::kFileContainingExtension:
                status = GetFileContainingExtension(request.file_containing_extension(), response);
                break;
            case Request::MessageRequestCase::kAllExtensionNumbersOfType:
                status = GetAllExtensionNumbers(request.all_extension_numbers_of_type(), response);
                break;
            case Request::MessageRequestCase::kListServices:
                ListService(*response.mutable_list_services_response());
                break;
            case Request::MessageRequestCase::MESSAGE_REQUEST_NOT_SET:
            default:
                LOG_WARNING() << "Closing reflection stream on a request without a known message_request";
                return grpc::Status(
                    grpc::StatusCode::INVALID_ARGUMENT,
                    fmt::format("invalid MessageRequest: case {}", static_cast<int>(request.message_request_case()))
                );
        }

        if (!status.ok()) {
            FillErrorResponse(status, *response.mutable_error_response());
        }
        response.set_valid_host(request.host());
        *response.mutable_original_request() = request;
        stream.Write(response);
    }

    return grpc::Status::OK;
}

void ProtoServerReflection::FillErrorResponse(
    const grpc::Status& status,
    proto_reflection::ErrorResponse& error_response
) {
    error_response.set_error_code(status.error_code());
    error_response.set_error_message(status.error_message());
}

void ProtoServerReflection::FillFileDescriptorResponse(const std::string& file_descriptor, Response& response) {
    response.mutable_file_descriptor_response()->add_file_descriptor_proto(file_descriptor);
}

void ProtoServerReflection::ListService(proto_reflection::ListServiceResponse& response) const {
    for (const auto& name : service_names_) {
        response.add_service()->set_name(name);
    }
}

grpc::Status ProtoServerReflection::GetFileByName(std::string_view file_name, Response& response) const {
    const auto* file_descriptor = index_.FindFile(file_name);
    if (file_descriptor == nullptr) {
        return NotFound(fmt::format("could not find descriptor for file \"{}\"", file_name));
    }
    FillFileDescriptorResponse(*file_descriptor, response);
    return grpc::Status::OK;
}

grpc::Status ProtoServerReflection::GetFileContainingSymbol(std::string_view symbol, Response& response) const {
    const auto* file_descriptor = index_.FindSymbol(symbol);
    if (file_descriptor == nullptr) {
        return NotFound(fmt::format("could not find descriptor for symbol \"{}\"", symbol));
    }
    FillFileDescriptorResponse(*file_descriptor, response);
    return grpc::Status::OK;
}

grpc::Status ProtoServerReflection::GetFileContainingExtension(
    const proto_reflection::ExtensionRequest& request,
    Response& response
) const {
    const auto& type = request.containing_type();
    const auto number = request.extension_number();
    if (index_.FindExtensionNumbers(type) == nullptr) {
        return NotFound(fmt::format("could not find extension type \"{}\"", type));
    }

    const auto* file_descriptor = index_.FindExtension(type, number);
    if (file_descriptor == nullptr) {
        return NotFound(fmt::format("could not find extension number {} on type \"{}\"", number, type));
    }
    FillFileDescriptorResponse(*file_descriptor, response);
    return grpc::Status::OK;
}

grpc::Status ProtoServerReflection::GetAllExtensionNumbers(std::string_view type, Response& response) const {
    const auto* numbers = index_.FindExtensionNumbers(type);
    if (numbers == nullptr) {
        return NotFound(fmt::format("could not find extension type \"{}\"", type));
    }

    auto& extension_response = *response.mutable_all_extension_numbers_response();
    extension_response.set_base_type_name(std::string{type});
    for (const auto& item : *numbers) {
        extension_response.add_extension_number(item.first);
    }
    return grpc::Status::OK;
}

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
