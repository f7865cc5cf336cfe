#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "server/auth_service_impl.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : labgate::common::DetectConfigPath();

    labgate::common::AppConfig config;
    try {
        config = labgate::common::ConfigLoader::Load(config_path);
        labgate::common::ConfigLoader::Validate(config);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    labgate::common::InitLogger(config.logging);
    LABGATE_LOG_INFO("LabGate server starting with config {}", config_path);

    labgate::server::AuthServiceImpl auth_service(config);

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&auth_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        LABGATE_LOG_ERROR("Failed to start gRPC server on {}", address);
        return EXIT_FAILURE;
    }

    LABGATE_LOG_INFO("LabGate server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LABGATE_LOG_WARN("Signal {} received, shutting down gRPC server...", static_cast<int>(g_stop_signal));
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    auth_service.WaitForBackgroundCleanup();
    labgate::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
