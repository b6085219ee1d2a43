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
#include "Bamrelay.h"

#include "DefaultHandler.h"

namespace bamrelay {

    const std::string DefaultHandler::_name = "defaulthandler";

    const std::string &DefaultHandler::name() const {
        return _name;
    }

    void DefaultHandler::handler(Connection &conn, const std::string &route) {
        conn.status(Connection::NOT_FOUND);
        conn.header("Content-Type", "text/plain");
        conn.setBuffer();

        try {
            conn << "No handler available" << Connection::flush_data;
        } catch (InputFailure &iofail) {
            Server::logger()->debug("No handler and no connection available.");
            return;
        }

        Server::logger()->info("No handler available for {} {}", Connection::method_as_string(conn.method()), conn.uri());
    }
    //=========================================================================

}
