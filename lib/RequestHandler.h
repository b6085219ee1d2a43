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
#ifndef BAMRELAY_REQUESTHANDLER_H
#define BAMRELAY_REQUESTHANDLER_H

#include <string>
#include <unordered_map>

#include "Connection.h"
#include "BamrelayConf.h"

namespace bamrelay {

    /*!
     * Abstract class for defining a request handler
     *
     * A handler is registered for one or more routes. Its configuration values are declared by
     * set_config_variables() before the command line is parsed and read back by
     * get_config_variables() afterwards. The configuration prefix is the handler's name.
     */
    class RequestHandler {
    protected:
        std::unordered_map<std::string, std::string> routedata;

    public:
        RequestHandler() = default;

        virtual ~RequestHandler() = default;

        [[nodiscard]] virtual const std::string &name() const = 0;

        inline void add_route_data(const std::string &route, const std::string &data) {
            routedata[route] = data;
        }

        /*!
         * Pure virtual function that gives the template for implementing a request handler.
         * Called concurrently from several worker threads.
         *
         * @param conn Connection reference
         * @param route The route the request matched
         */
        virtual void handler(Connection &conn, const std::string &route) = 0;

        virtual inline void set_config_variables(BamrelayConf &conf) {}

        virtual inline void get_config_variables(const BamrelayConf &conf) {}
    };

}

#endif //BAMRELAY_REQUESTHANDLER_H
