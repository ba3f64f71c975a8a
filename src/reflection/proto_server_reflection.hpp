/*
 *
 * Copyright 2015 gRPC authors.
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

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <grpcpp/support/status.h>

#include <rpcreflect/reflection/service_meta.hpp>
#include <rpcreflect/server/stream.hpp>

#include <reflection.pb.h>

#include <reflection/descriptor_index.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace reflection {

/// @brief grpc.reflection.v1alpha.ServerReflection protocol over a DescriptorIndex
///
/// Stateless between calls; any number of streams may be served concurrently.
class ProtoServerReflection final {
public:
    using Request = grpc::reflection::v1alpha::ServerReflectionRequest;
    using Response = grpc::reflection::v1alpha::ServerReflectionResponse;
    using ServerReflectionInfoReaderWriter = server::BidirectionalStream<Request, Response>;

    ProtoServerReflection(std::vector<std::string> service_names, DescriptorIndex index);

    /// @brief Indexes the metas followed by the reflection service's own meta
    /// @throws IndexBuildError
    static std::unique_ptr<ProtoServerReflection> Create(std::vector<ServiceMeta> metas);

    // implementation of ServerReflectionInfo(stream ServerReflectionRequest) rpc
    // in ServerReflection service
    grpc::Status ServerReflectionInfo(ServerReflectionInfoReaderWriter& stream) const;

    const std::vector<std::string>& GetServiceNames() const noexcept { return service_names_; }

    const DescriptorIndex& GetIndex() const noexcept { return index_; }

private:
    void ListService(grpc::reflection::v1alpha::ListServiceResponse& response) const;

    grpc::Status GetFileByName(std::string_view file_name, Response& response) const;

    grpc::Status GetFileContainingSymbol(std::string_view symbol, Response& response) const;

    grpc::Status
    GetFileContainingExtension(const grpc::reflection::v1alpha::ExtensionRequest& request, Response& response) const;

    grpc::Status GetAllExtensionNumbers(std::string_view type, Response& response) const;

    static void FillFileDescriptorResponse(const std::string& file_descriptor, Response& response);

    static void FillErrorResponse(const grpc::Status& status, grpc::reflection::v1alpha::ErrorResponse& error_response);

    const std::vector<std::string> service_names_;
    const DescriptorIndex index_;
};

}  // namespace reflection

RPCREFLECT_NAMESPACE_END
