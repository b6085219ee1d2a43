/*
 * Copyright © 2022 Lukas Rosenthaler
 * This file is part of bamrelay
 * bamrelay is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * bamrelay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 */
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include "Bamrelay.h"
#include "BamrelayConf.h"
#include "RequestHandler.h"

#include "../handlers/pinghandler/PingHandler.h"
#include "../handlers/objecthandler/ObjectHandler.h"
#include "../handlers/objecthandler/store/S3ObjectStore.h"

int main(int argc, char *argv[]) {
    auto logger = bamrelay::Server::create_logger(spdlog::level::info);
    logger->info(bamrelay::Server::version_string());

    //
    // the SDK must outlive all S3 clients, which are owned by the handlers
    //
    bamrelay::AwsSdk aws_sdk;

    std::unordered_map<std::string, std::shared_ptr<bamrelay::RequestHandler>> handlers;
    {
        auto pinghandler = std::make_shared<bamrelay::PingHandler>();
        handlers[pinghandler->name()] = pinghandler;

        auto objecthandler = std::make_shared<bamrelay::ObjectHandler>();
        handlers[objecthandler->name()] = objecthandler;
    }

    //
    // read the configuration parameters. The parameters can be defined in
    // 1) a lua configuration file
    // 2) environment variables
    // 3) commandline parameters.
    // The configuration file parameters (lowest priority) are superseded by the environment variables which are
    // superseded by the command line parameters (highest priority)
    //
    bamrelay::BamrelayConf config;
    const std::string prefix{"bamrelay"};

    unsigned hw_threads = std::thread::hardware_concurrency();
    config.add_config(prefix, "config", "", "Lua configuration file.");
    config.add_config(prefix, "userid", "", "Username to run bamrelay. Must be launched as root to use this option.");
    config.add_config(prefix, "port", 8080, "HTTP port to be used.");
    config.add_config(prefix, "sslport", -1, "HTTPS port to be used (-1 disables SSL).");
    config.add_config(prefix, "sslcert", "", "Path to the SSL certificate (PEM).");
    config.add_config(prefix, "sslkey", "", "Path to the SSL key file (PEM).");
    config.add_config(prefix, "nthreads", static_cast<int>(hw_threads > 0 ? hw_threads : 4), "Number of worker threads.");
    config.add_config(prefix, "keepalive", 5, "Number of seconds for the keep-alive option of HTTP 1.1. Set to 0 for no keep-alive.");
    config.add_config(prefix, "iotimeout", 30, "Send and receive timeout of client connections in seconds.");
    config.add_config(prefix, "logfile", "", "Name of the logfile, empty for console logging only.");
    config.add_config(prefix, "loglevel", spdlog::level::info, "Logging level. Value can be: 'TRACE', 'DEBUG', 'INFO', 'WARN', 'ERR', 'CRITICAL', 'OFF'.");

    //
    // load the configuration variables of the handlers
    //
    for (auto &[name, handler]: handlers) {
        handler->set_config_variables(config);
    }

    try {
        if (!config.parse_cmdline_args(argc, (const char **) argv)) {
            return config.serverconf_ok();
        }
    } catch (const bamrelay::Error &err) {
        logger->error("Invalid configuration: {}", err.to_string());
        return 1;
    }

    logger = bamrelay::Server::create_logger(config.get_loglevel("loglevel").value(), true,
                                             config.get_string("logfile").value());

    int port = config.get_int("port").value();
    int nthreads = config.get_int("nthreads").value();
    if (nthreads < 1) nthreads = 1;
    std::string userid = config.get_string("userid").value();

    bamrelay::Server server(port, static_cast<unsigned>(nthreads), userid); // instantiate the server

    server.ssl_port(config.get_int("sslport").value()); // -1 means no ssl socket
    std::string ssl_certificate = config.get_string("sslcert").value();
    if (!ssl_certificate.empty()) server.ssl_certificate(ssl_certificate);
    std::string ssl_key = config.get_string("sslkey").value();
    if (!ssl_key.empty()) server.ssl_key(ssl_key);
    server.keep_alive_timeout(config.get_int("keepalive").value());
    server.io_timeout(config.get_int("iotimeout").value());

    //
    // setup the routes of the handlers
    //
    try {
        for (auto &[name, handler]: handlers) {
            handler->get_config_variables(config);
            auto routes = config.get_luaroutes(handler->name(), "routes").value();
            for (auto &route: routes) {
                server.addRoute(route.method, route.route, handler);
                handler->add_route_data(route.route, route.additional_data);
                logger->info("Added route: handler: '{}' method: '{}', route: '{}' route data: '{}'", name,
                             route.method_as_string(), route.route, route.additional_data);
            }
        }
    } catch (const bamrelay::Error &err) {
        logger->error("Could not setup the handlers: {}", err.to_string());
        return 1;
    }

    try {
        server.run();
    } catch (const bamrelay::Error &err) {
        logger->error("Server failed: {}", err.to_string());
        return 1;
    }
    logger->info("bamrelay has finished its service");
    return 0;
}
