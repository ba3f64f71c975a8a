#include <rpcreflect/reflection/reflection_service.hpp>

#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>

#include <rpcreflect/reflection/exceptions.hpp>

#include <reflection/test_descriptors.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace {

namespace proto_reflection = grpc::reflection::v1alpha;
namespace tests = reflection::tests;

class ReflectionServiceTest : public testing::Test {
protected:
    ReflectionServiceTest()
        : service_(reflection::MakeReflectionService({tests::MakeMeta("Bar", {tests::MainFile(), tests::OtherFile()})})
          ) {
        grpc::ServerBuilder builder;
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        stub_ = proto_reflection::ServerReflection::NewStub(server_->InProcessChannel(grpc::ChannelArguments{}));
    }

    ~ReflectionServiceTest() override { server_->Shutdown(); }

    proto_reflection::ServerReflection::Stub& GetStub() { return *stub_; }

private:
    std::unique_ptr<reflection::ReflectionService> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<proto_reflection::ServerReflection::Stub> stub_;
};

}  // namespace

TEST_F(ReflectionServiceTest, Stream) {
    grpc::ClientContext context;
    auto stream = GetStub().ServerReflectionInfo(&context);

    proto_reflection::ServerReflectionRequest request;
    request.set_host("localhost");
    request.set_file_by_filename("main.proto");
    ASSERT_TRUE(stream->Write(request));

    proto_reflection::ServerReflectionResponse response;
    ASSERT_TRUE(stream->Read(&response));
    EXPECT_EQ(response.valid_host(), "localhost");
    ASSERT_TRUE(response.has_file_descriptor_response()) << response.ShortDebugString();
    EXPECT_THAT(
        response.file_descriptor_response().file_descriptor_proto(),
        testing::ElementsAre(tests::Serialize(tests::MainFile()))
    );

    request.set_file_by_filename("missing.proto");
    ASSERT_TRUE(stream->Write(request));
    ASSERT_TRUE(stream->Read(&response));
    ASSERT_TRUE(response.has_error_response());
    EXPECT_EQ(response.error_response().error_code(), grpc::StatusCode::NOT_FOUND);

    request.set_list_services("");
    ASSERT_TRUE(stream->Write(request));
    ASSERT_TRUE(stream->Read(&response));
    ASSERT_EQ(response.list_services_response().service_size(), 2);
    EXPECT_EQ(response.list_services_response().service(0).name(), "Bar");
    EXPECT_EQ(response.list_services_response().service(1).name(), reflection::kReflectionServiceName);

    ASSERT_TRUE(stream->WritesDone());
    EXPECT_FALSE(stream->Read(&response));
    const auto status = stream->Finish();
    EXPECT_TRUE(status.ok()) << status.error_message();
}

TEST_F(ReflectionServiceTest, InvalidRequestFailsStream) {
    grpc::ClientContext context;
    auto stream = GetStub().ServerReflectionInfo(&context);

    ASSERT_TRUE(stream->Write(proto_reflection::ServerReflectionRequest{}));
    ASSERT_TRUE(stream->WritesDone());

    proto_reflection::ServerReflectionResponse response;
    EXPECT_FALSE(stream->Read(&response));
    const auto status = stream->Finish();
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(ReflectionService, ServiceNames) {
    const auto service = reflection::MakeReflectionService({tests::MakeMeta("Bar", {tests::MainFile()})});
    EXPECT_THAT(service->GetServiceNames(), testing::ElementsAre("Bar", reflection::kReflectionServiceName));
}

TEST(ReflectionService, ConflictingMetas) {
    EXPECT_THROW(
        reflection::MakeReflectionService({
            tests::MakeMeta("someService", {tests::MainFile()}),
            tests::MakeMeta("otherService", {tests::ConflictMessageFile()}),
        }),
        reflection::SymbolConflictError
    );
}

RPCREFLECT_NAMESPACE_END
