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
#ifndef BAMRELAY_LUACONFIG_H
#define BAMRELAY_LUACONFIG_H

#include <iostream>
#include <string>
#include <vector>

#include "spdlog/common.h"
#include "lua.hpp"

#include "Error.h"
#include "Connection.h"

namespace bamrelay {

    /*!
     * \brief A route of a request handler
     *
     * The string representation is "METHOD:/route:data", e.g. "GET:/files:s3". The meaning of the
     * additional data depends on the handler.
     */
    typedef struct RouteInfo {
        Connection::HttpMethod method{Connection::GET};
        std::string route;
        std::string additional_data;

        RouteInfo() = default;

        /*!
         * Parses a route in the form "METHOD:/route:data". The data part is optional.
         *
         * \throws Error if the method is unknown or the route is missing
         */
        explicit RouteInfo(const std::string &route_str);

        [[nodiscard]] std::string method_as_string() const;

        [[nodiscard]] std::string to_string() const;

        inline bool empty() const { return route.empty(); }

        inline bool operator==(const RouteInfo &lr) const {
            return method == lr.method && route == lr.route && additional_data == lr.additional_data;
        }

        inline friend std::ostream &operator<<(std::ostream &os, const RouteInfo &rhs) {
            return os << "ROUTE METHOD=" << rhs.method_as_string() << " ROUTE=" << rhs.route << " DATA=" << rhs.additional_data;
        };
    } LuaRoute;

    /*!
     * \brief Reads configuration values from a Lua configuration file
     *
     * The configuration file is a Lua script that defines one global table per prefix, e.g.
     *
     *     bamrelay = { port = 8080, loglevel = "DEBUG" }
     *     objecthandler = {
     *         s3bucket = "genomes",
     *         routes = { { method = "GET", route = "/files", data = "s3" } }
     *     }
     *
     * All config* methods return the given default if the table or the variable does not exist.
     */
    class LuaConfig {
    private:
        lua_State *L;

    public:
        /*!
         * Loads and executes a Lua configuration file
         *
         * \param[in] luafile Path of the file or, if iscode is true, a Lua chunk
         * \param[in] iscode If true, luafile is Lua source code
         * \throws Error if the file cannot be loaded or executed
         */
        explicit LuaConfig(const std::string &luafile, bool iscode = false);

        LuaConfig(const LuaConfig &) = delete;

        LuaConfig &operator=(const LuaConfig &) = delete;

        ~LuaConfig();

        std::string configString(const std::string &table, const std::string &variable, const std::string &defval);

        bool configBoolean(const std::string &table, const std::string &variable, bool defval);

        int configInteger(const std::string &table, const std::string &variable, int defval);

        float configFloat(const std::string &table, const std::string &variable, float defval);

        spdlog::level::level_enum configLoglevel(const std::string &table, const std::string &variable,
                                                 spdlog::level::level_enum defval);

        /*!
         * Reads a list of routes. The variable is either an array of tables with the fields
         * "method", "route" and "data", or a string "GET:/a:x;HEAD:/a:x".
         */
        std::vector<RouteInfo> configRoute(const std::string &table, const std::string &variable,
                                           const std::vector<RouteInfo> &defval);
    };

    /*!
     * Converts a log level name (TRACE, DEBUG, INFO, WARN, ERR, CRITICAL, OFF) to the spdlog level.
     *
     * \throws Error if the name is unknown
     */
    extern spdlog::level::level_enum loglevel_from_string(const std::string &name);

    extern std::string loglevel_to_string(spdlog::level::level_enum level);

}

#endif //BAMRELAY_LUACONFIG_H
