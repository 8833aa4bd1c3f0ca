#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <core/constant/path.h>
#include <core/network/server/http_server.h>
#include <core/security/open_ssl_provider.h>
#include <core/ssh/libssh_client.h>
#include <core/ssh/session_factory.h>
#include <core/transfer/transfer_orchestrator.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

using namespace sftpgate;
using namespace sftpgate::core;
namespace net = boost::asio;
namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

void runIoContext(net::io_context& io_context, unsigned int thread_count) {
    std::vector<std::thread> threads;
    threads.reserve(thread_count - 1);

    // The calling thread is the last worker.
    for (unsigned int i = 1; i < thread_count; ++i) {
        threads.emplace_back([&io_context]() {
            try {
                io_context.run();
            } catch (const std::exception& e) {
                spdlog::error("IO thread error: {}", e.what());
                io_context.stop();
            }
        });
    }
    try {
        io_context.run();
    } catch (const std::exception& e) {
        spdlog::error("IO thread error: {}", e.what());
        io_context.stop();
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("sftpgate - HTTP to SFTP file transfer service\n\nOptions");
    desc.add_options()("help,h", "show this help message")(
        "config,c",
        po::value<std::string>(),
        "TOML config file (default: ~/.config/sftpgate/config.toml)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "error: " << e.what() << "\n\n" << desc << "\n";
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    const bool explicit_config = vm.count("config") > 0;
    const fs::path config_file = explicit_config ? fs::path(vm["config"].as<std::string>())
                                                 : path::kDefaultConfigFile;

    Settings settings;
    try {
        settings = LoadSettings(config_file, explicit_config);
    } catch (const ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    Logger logger(Logger::ParseLevel(settings.log.level), settings.log.dir);

    try {
        LibsshConnector::InitLibrary();
        if (settings.server.https()) {
            OpenSSLProvider::InitOpenSSL();
        }
    } catch (const std::exception& e) {
        spdlog::critical("Initialization failed: {}", e.what());
        return 1;
    }

    if (std::holds_alternative<AcceptAnyHostKey>(settings.ssh.host_key_policy)) {
        spdlog::warn("SSH host keys are not verified (host-key-policy = accept-any)");
    }

    TransferOrchestrator orchestrator(
        CredentialDefaults{
            .username = settings.ssh.username,
            .password = settings.ssh.password,
            .private_key_path = settings.ssh.key_path,
        },
        SessionFactory(settings.ssh.host_key_policy),
        std::make_shared<LibsshConnector>());

    net::io_context io_context(static_cast<int>(settings.server.worker_threads));

    std::optional<HttpServer> server;
    try {
        server.emplace(io_context, settings, orchestrator);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to create server: {}", e.what());
        return 1;
    }
    server->Start(settings.server.port);
    if (!server->running()) {
        return 1;
    }

    net::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        server->Stop();
        io_context.stop();
    });

    spdlog::info("sftpgate started with {} worker thread(s), host-key-policy = {}",
                 settings.server.worker_threads,
                 HostKeyPolicyName(settings.ssh.host_key_policy));

    runIoContext(io_context, settings.server.worker_threads);

    server.reset();
    LibsshConnector::FinalizeLibrary();
    spdlog::info("sftpgate stopped");
    return 0;
}
