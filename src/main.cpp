/**
 * @file main.cpp
 * @brief Implements startup for the read-only TFTP daemon.
 */

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <fmt/format.h>
#include "meta/logging.hpp"
#include "mybsock/netconfig.hpp"
#include "mybsock/sockets.hpp"
#include "mytftpd/config.hpp"
#include "mytftpd/driver.hpp"
#include "mytftpd/handlers.hpp"

int main(int argc, char* argv[]) {
    using namespace RollTftp;

    auto [config_opt, config_error] = Driver::parseServerArgs(argc, argv);

    if (not config_opt) {
        std::cerr << "Invalid arguments: " << config_error << '\n' << Driver::usageText();
        return 1;
    }

    const auto& config = *config_opt;
    Meta::Logger logger {std::cout, "rolltftpd", config.log_level};

    std::error_code root_error;

    if (not std::filesystem::is_directory(config.root, root_error)) {
        logger.logMessage<Meta::LogLevel::fatal>("serving root '{}' is not a directory", config.root.string());
        return 1;
    }

    auto make_socket = [&logger] (const char* host_cstr, const char* port_cstr) -> MyBSock::UDPServerSocket {
        MyBSock::SocketGenerator generator {host_cstr, port_cstr};

        while (generator) {
            if (auto fd_opt = generator(); fd_opt.has_value()) {
                return {*fd_opt};
            }
        }

        logger.logMessage<Meta::LogLevel::fatal>("could not bind {}:{}: {}", host_cstr, port_cstr, generator.getLastError());

        return {};
    };

    try {
        auto server_socket = make_socket(config.address.c_str(), config.port.c_str());

        if (not server_socket.isUsable()) {
            return 1;
        }

        Driver::FileHandler handler {config.root};
        Driver::MyServer app {std::move(server_socket), handler, config.engine, logger};

        logger.logMessage<Meta::LogLevel::info>("listening on {}:{}, serving '{}'", config.address, config.port, config.root.string());

        if (not Driver::bindStopSignals(&app)) {
            logger.logMessage<Meta::LogLevel::warning>("could not install stop signal handlers");
        }

        const auto service_ok = app.runService();

        if (not Driver::bindStopSignals(nullptr)) {
            logger.logMessage<Meta::LogLevel::warning>("could not restore default signal handlers");
        }

        if (not service_ok) {
            logger.logMessage<Meta::LogLevel::fatal>("service on {}:{} stopped on a socket error", config.address, config.port);
            return 1;
        }
    } catch (const std::exception& setup_error) {
        if (not Driver::bindStopSignals(nullptr)) {
            logger.logMessage<Meta::LogLevel::warning>("could not restore default signal handlers");
        }

        logger.logMessage<Meta::LogLevel::fatal>("{}", setup_error.what());
        return 1;
    }
}
