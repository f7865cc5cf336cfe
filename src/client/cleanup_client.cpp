#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "auth_service.grpc.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;
using proto::auth::AuthService;
using proto::auth::RunCleanupRequest;
using proto::auth::RunCleanupResponse;

// 供 cron 调用的清理客户端: labgate_cleanup [address]
// api key 从环境变量 LABGATE_CLEANUP_API_KEY 读取
class CleanupClient {
public:
    explicit CleanupClient(std::shared_ptr<Channel> channel)
        : stub_(AuthService::NewStub(channel)) {}

    bool Run(const std::string& api_key) {
        RunCleanupRequest request;
        RunCleanupResponse response;
        ClientContext context;
        if (!api_key.empty()) {
            context.AddMetadata("x-api-key", api_key);
        }

        Status status = stub_->RunCleanup(&context, request, &response);
        if (!status.ok()) {
            std::cerr << "RunCleanup failed: " << status.error_message() << std::endl;
            return false;
        }
        std::cout << "sessions_deleted=" << response.sessions_deleted()
                  << " codes_deleted=" << response.codes_deleted()
                  << " timestamp=" << response.timestamp() << std::endl;
        return true;
    }

private:
    std::unique_ptr<AuthService::Stub> stub_;
};

int main(int argc, char** argv) {
    std::string server_address("localhost:50061");
    if (argc > 1) {
        server_address = argv[1];
    }
    std::string api_key;
    if (const char* env = std::getenv("LABGATE_CLEANUP_API_KEY")) {
        api_key = env;
    }

    auto channel = grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials());
    CleanupClient client(channel);
    return client.Run(api_key) ? EXIT_SUCCESS : EXIT_FAILURE;
}
