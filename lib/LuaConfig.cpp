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
#include <utility>

#include "Global.h"
#include "LuaConfig.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    static Connection::HttpMethod method_from_string(const std::string &method) {
        std::string m = strtoupper(trim_copy(method));
        for (int i = 0; i < Connection::NumHttpMethods; i++) {
            auto hm = static_cast<Connection::HttpMethod>(i);
            if (Connection::method_as_string(hm) == m) return hm;
        }
        throw Error(file_, __LINE__, "Unknown HTTP method: " + method);
    }
    //=========================================================================

    RouteInfo::RouteInfo(const std::string &route_str) {
        size_t pos1 = route_str.find(':');
        if (pos1 == std::string::npos) {
            throw Error(file_, __LINE__, "Invalid route (expected METHOD:/route:data): " + route_str);
        }
        method = method_from_string(route_str.substr(0, pos1));
        size_t pos2 = route_str.find(':', pos1 + 1);
        if (pos2 == std::string::npos) {
            route = trim_copy(route_str.substr(pos1 + 1));
        } else {
            route = trim_copy(route_str.substr(pos1 + 1, pos2 - pos1 - 1));
            additional_data = trim_copy(route_str.substr(pos2 + 1));
        }
        if (route.empty()) {
            throw Error(file_, __LINE__, "Invalid route (empty path): " + route_str);
        }
    }
    //=========================================================================

    std::string RouteInfo::method_as_string() const {
        return Connection::method_as_string(method);
    }
    //=========================================================================

    std::string RouteInfo::to_string() const {
        return method_as_string() + ":" + route + ":" + additional_data;
    }
    //=========================================================================

    spdlog::level::level_enum loglevel_from_string(const std::string &name) {
        std::string n = strtoupper(trim_copy(name));
        if (n == "TRACE") return spdlog::level::trace;
        if (n == "DEBUG") return spdlog::level::debug;
        if (n == "INFO") return spdlog::level::info;
        if (n == "WARN" || n == "WARNING") return spdlog::level::warn;
        if (n == "ERR" || n == "ERROR") return spdlog::level::err;
        if (n == "CRITICAL") return spdlog::level::critical;
        if (n == "OFF") return spdlog::level::off;
        throw Error(file_, __LINE__, "Unknown log level: " + name);
    }
    //=========================================================================

    std::string loglevel_to_string(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARN";
            case spdlog::level::err: return "ERR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "OFF";
        }
    }
    //=========================================================================

    static int dont_panic(lua_State *L) {
        const char *msg = lua_tostring(L, -1);
        throw Error(file_, __LINE__, std::string("Lua panic: ") + (msg == nullptr ? "unknown error" : msg));
    }
    //=========================================================================

    LuaConfig::LuaConfig(const std::string &luafile, bool iscode) {
        if ((L = luaL_newstate()) == nullptr) {
            throw Error(file_, __LINE__, "Couldn't start lua interpreter");
        }
        lua_atpanic(L, dont_panic);
        luaL_openlibs(L);

        int status = iscode ? luaL_loadstring(L, luafile.c_str()) : luaL_loadfile(L, luafile.c_str());
        if (status == LUA_OK) {
            status = lua_pcall(L, 0, 0, 0);
        }
        if (status != LUA_OK) {
            const char *msg = lua_tostring(L, -1);
            std::string errmsg = "Error in configuration \"" + (iscode ? std::string("<code>") : luafile) + "\": "
                    + (msg == nullptr ? "unknown error" : msg);
            lua_close(L);
            throw Error(file_, __LINE__, errmsg);
        }
    }
    //=========================================================================

    LuaConfig::~LuaConfig() {
        lua_close(L);
    }
    //=========================================================================

    std::string LuaConfig::configString(const std::string &table, const std::string &variable, const std::string &defval) {
        if (lua_getglobal(L, table.c_str()) != LUA_TTABLE) {
            lua_pop(L, 1);
            return defval;
        }
        lua_getfield(L, -1, variable.c_str());
        if (lua_isnil(L, -1)) {
            lua_pop(L, 2);
            return defval;
        }
        if (!lua_isstring(L, -1)) {
            lua_pop(L, 2);
            throw Error(file_, __LINE__, "String expected for " + table + "." + variable);
        }
        std::string retval = lua_tostring(L, -1);
        lua_pop(L, 2);
        return retval;
    }
    //=========================================================================

    bool LuaConfig::configBoolean(const std::string &table, const std::string &variable, bool defval) {
        if (lua_getglobal(L, table.c_str()) != LUA_TTABLE) {
            lua_pop(L, 1);
            return defval;
        }
        lua_getfield(L, -1, variable.c_str());
        if (lua_isnil(L, -1)) {
            lua_pop(L, 2);
            return defval;
        }
        if (!lua_isboolean(L, -1)) {
            lua_pop(L, 2);
            throw Error(file_, __LINE__, "Boolean expected for " + table + "." + variable);
        }
        bool retval = lua_toboolean(L, -1) == 1;
        lua_pop(L, 2);
        return retval;
    }
    //=========================================================================

    int LuaConfig::configInteger(const std::string &table, const std::string &variable, int defval) {
        if (lua_getglobal(L, table.c_str()) != LUA_TTABLE) {
            lua_pop(L, 1);
            return defval;
        }
        lua_getfield(L, -1, variable.c_str());
        if (lua_isnil(L, -1)) {
            lua_pop(L, 2);
            return defval;
        }
        if (!lua_isinteger(L, -1)) {
            lua_pop(L, 2);
            throw Error(file_, __LINE__, "Integer expected for " + table + "." + variable);
        }
        int retval = static_cast<int>(lua_tointeger(L, -1));
        lua_pop(L, 2);
        return retval;
    }
    //=========================================================================

    float LuaConfig::configFloat(const std::string &table, const std::string &variable, float defval) {
        if (lua_getglobal(L, table.c_str()) != LUA_TTABLE) {
            lua_pop(L, 1);
            return defval;
        }
        lua_getfield(L, -1, variable.c_str());
        if (lua_isnil(L, -1)) {
            lua_pop(L, 2);
            return defval;
        }
        if (!lua_isnumber(L, -1)) {
            lua_pop(L, 2);
            throw Error(file_, __LINE__, "Number expected for " + table + "." + variable);
        }
        lua_Number num = lua_tonumber(L, -1);
        lua_pop(L, 2);
        return static_cast<float>(num);
    }
    //=========================================================================

    spdlog::level::level_enum LuaConfig::configLoglevel(const std::string &table, const std::string &variable,
                                                        spdlog::level::level_enum defval) {
        std::string name = configString(table, variable, loglevel_to_string(defval));
        return loglevel_from_string(name);
    }
    //=========================================================================

    std::vector<RouteInfo> LuaConfig::configRoute(const std::string &table, const std::string &variable,
                                                  const std::vector<RouteInfo> &defval) {
        if (lua_getglobal(L, table.c_str()) != LUA_TTABLE) {
            lua_pop(L, 1);
            return defval;
        }
        lua_getfield(L, -1, variable.c_str()); // table - routes
        if (lua_isnil(L, -1)) {
            lua_pop(L, 2);
            return defval;
        }

        std::vector<RouteInfo> routes;
        if (lua_type(L, -1) == LUA_TSTRING) {
            std::string routestr = lua_tostring(L, -1);
            lua_pop(L, 2);
            for (auto &r: split(routestr, ';')) {
                if (!trim_copy(r).empty()) routes.emplace_back(r);
            }
            return routes;
        }
        if (!lua_istable(L, -1)) {
            lua_pop(L, 2);
            throw Error(file_, __LINE__, "Value '" + table + "." + variable + "' in config file must be a table");
        }

        static const char *fields[] = {"method", "route", "data"};
        for (int i = 1;; i++) {
            if (lua_rawgeti(L, -1, i) == LUA_TNIL) { // table - routes - entry
                lua_pop(L, 1);
                break;
            }
            if (!lua_istable(L, -1)) {
                lua_pop(L, 3);
                throw Error(file_, __LINE__, "Route entries of '" + table + "." + variable + "' must be tables");
            }
            std::string values[3];
            for (int f = 0; f < 3; f++) {
                lua_getfield(L, -1, fields[f]); // table - routes - entry - value
                if (lua_isstring(L, -1)) {
                    values[f] = lua_tostring(L, -1);
                } else if (!lua_isnil(L, -1) || f < 2) {
                    lua_pop(L, 4);
                    throw Error(file_, __LINE__, "Field '" + std::string(fields[f]) + "' of route in '" + table + "." + variable + "' must be a string");
                }
                lua_pop(L, 1);
            }
            lua_pop(L, 1); // table - routes
            RouteInfo route(values[0] + ":" + values[1] + ":" + values[2]);
            routes.push_back(route);
        }
        lua_pop(L, 2);
        return routes;
    }
    //=========================================================================

}
