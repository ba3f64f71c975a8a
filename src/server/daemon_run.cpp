#include <rpcreflect/server/daemon_run.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>

#include <rpcreflect/logging/log.hpp>
#include <rpcreflect/reflection/reflection_service.hpp>
#include <rpcreflect/server/config.hpp>
#include <rpcreflect/server/descriptor_set.hpp>

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

namespace {

constexpr std::string_view kDefaultLoggerName = "default";

void SetupLogging(const LoggingConfig& config) {
    logging::SetDefaultLogger(
        config.file == kStderrLogFile ? logging::MakeStderrLogger(std::string{kDefaultLoggerName})
                                      : logging::MakeFileLogger(std::string{kDefaultLoggerName}, config.file)
    );
    logging::SetDefaultLoggerLevel(config.level);
}

sigset_t BlockShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    // Threads started afterwards, gRPC ones included, inherit the mask
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

void Run(const std::string& config_path) {
    const auto config = LoadServerConfig(config_path);
    SetupLogging(config.logging);

    auto service = reflection::MakeReflectionService(LoadServiceMetas(config));

    const auto signals = BlockShutdownSignals();

    int selected_port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(service.get());
    const std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
    if (!server || selected_port == 0) {
        throw std::runtime_error(fmt::format("Failed to listen on '{}'", config.listen_address));
    }
    LOG_INFO() << "Reflection server is listening on " << config.listen_address << ", port " << selected_port;

    std::thread shutdown_waiter{[&server, signals] {
        int signal = 0;
        sigwait(&signals, &signal);
        LOG_INFO() << "Got signal " << signal << ", shutting down";
        server->Shutdown();
    }};
    server->Wait();
    shutdown_waiter.join();

    LOG_INFO() << "Reflection server stopped";
    logging::LogFlush();
}

}  // namespace

boost::program_options::options_description BaseRunOptions() {
    namespace po = boost::program_options;
    po::options_description desc("Allowed options");
    // clang-format off
    desc.add_options()
        ("help,h", "produce this help message")
        ("config,c", po::value<std::string>(), "path to server config")
    ;
    // clang-format on
    return desc;
}

int DaemonMain(const int argc, const char* const argv[]) {
    namespace po = boost::program_options;
    po::variables_map vm;
    const auto desc = BaseRunOptions();

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    if (vm.count("help")) {
        std::cerr << desc << '\n';
        return 0;
    }
    if (!vm.count("config")) {
        std::cerr << "the option '--config' is required but missing\n" << desc << '\n';
        return 1;
    }

    return DaemonMain(vm);
}

int DaemonMain(const boost::program_options::variables_map& vm) {
    try {
        Run(vm["config"].as<std::string>());
        return 0;
    } catch (const std::exception& ex) {
        auto msg = fmt::format("Unhandled exception in server::Run: {}", ex.what());
        LOG_CRITICAL() << msg;
        std::cerr << msg << '\n';
        return 1;
    } catch (...) {
        auto msg = fmt::format(
            "Non-standard exception in server::Run: {}", boost::current_exception_diagnostic_information()
        );
        std::cerr << msg << '\n';
        return 1;
    }
}

}  // namespace server

RPCREFLECT_NAMESPACE_END
