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
#include "HttpSendError.h"

namespace bamrelay {

    void send_error(Connection &conn_obj, Connection::StatusCodes code, const std::string &errmsg) {
        std::string http_err_name{};
        switch (code) {
            case Connection::BAD_REQUEST: http_err_name = "Bad Request"; break;
            case Connection::FORBIDDEN: http_err_name = "Forbidden"; break;
            case Connection::UNAUTHORIZED: http_err_name = "Unauthorized"; break;
            case Connection::NOT_FOUND: http_err_name = "Not Found"; break;
            case Connection::METHOD_NOT_ALLOWED: http_err_name = "Method Not Allowed"; break;
            case Connection::INTERNAL_SERVER_ERROR: http_err_name = "Internal Server Error"; break;
            case Connection::NOT_IMPLEMENTED: http_err_name = "Not Implemented"; break;
            case Connection::BAD_GATEWAY: http_err_name = "Bad Gateway"; break;
            case Connection::SERVICE_UNAVAILABLE: http_err_name = "Service Unavailable"; break;
            case Connection::GATEWAY_TIMEOUT: http_err_name = "Gateway Timeout"; break;
            default: http_err_name = "Unknown error"; break;
        }

        if (conn_obj.headerSent()) {
            Server::logger()->error("{} {} failed after the header was sent ({}: {})",
                                    Connection::method_as_string(conn_obj.method()), conn_obj.uri(), http_err_name, errmsg);
            return;
        }

        try {
            conn_obj.status(code);
            conn_obj.setBuffer();
            conn_obj.header("Content-Type", "text/plain");

            // Send an error message to the client.
            conn_obj << http_err_name;
            if (!errmsg.empty()) {
                conn_obj << ": " << errmsg;
            }
            conn_obj.flush();
        }
        catch (InputFailure &iofail) {}

        Server::logger()->error("{} {} failed ({}{}{})", Connection::method_as_string(conn_obj.method()), conn_obj.uri(),
                                http_err_name, errmsg.empty() ? "" : ": ", errmsg);
    }
    //=========================================================================

    void send_error(Connection &conn_obj, Connection::StatusCodes code, const Error &err) {
        send_error(conn_obj, code, err.getMessage());
    }
    //=========================================================================

    void send_error(Connection &conn_obj, Connection::StatusCodes code) {
        send_error(conn_obj, code, "");
    }
    //=========================================================================

}
