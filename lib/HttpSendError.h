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
#ifndef BAMRELAY_HTTPSENDERROR_H
#define BAMRELAY_HTTPSENDERROR_H

#include <string>

#include "Connection.h"

namespace bamrelay {

    /*!
     * Sends an HTTP error response with a short text/plain body and logs the error. Must only be
     * called before the header of the response has been sent.
     *
     * \param conn_obj the server connection.
     * \param code the HTTP status code to be returned.
     * \param errmsg description appended to the reason phrase, may be empty.
     */
    extern void send_error(Connection &conn_obj, Connection::StatusCodes code, const std::string &errmsg);

    extern void send_error(Connection &conn_obj, Connection::StatusCodes code, const Error &err);

    extern void send_error(Connection &conn_obj, Connection::StatusCodes code);

}

#endif //BAMRELAY_HTTPSENDERROR_H
