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
#include <vector>

#include "Bamrelay.h"
#include "PingHandler.h"

namespace bamrelay {

    const std::string PingHandler::_name = "pinghandler";

    const std::string &PingHandler::name() const {
        return _name;
    }

    void PingHandler::handler(Connection &conn, const std::string &route) {
        try {
            conn.header("Content-Type", "text/plain; charset=utf-8");
            conn.setBuffer();
            conn << _echo << Connection::flush_data;
        }
        catch (InputFailure &iofail) {
            Server::logger()->debug("Ping: client closed the connection");
            return;
        }
    }

    void PingHandler::set_config_variables(BamrelayConf &conf) {
        std::vector<RouteInfo> routes = {
                RouteInfo("GET:/ping:C++"),
        };
        conf.add_config(_name, "routes", routes, "Route for the ping handler");
        conf.add_config(_name, "echo", "PONG", "Message to echo");
    }

    void PingHandler::get_config_variables(const BamrelayConf &conf) {
        _echo = conf.get_string("echo").value_or("PONG");
    }

}
