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
#ifndef BAMRELAY_BAMRELAYCONF_H
#define BAMRELAY_BAMRELAYCONF_H

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "spdlog/common.h"
#include "CLI/CLI.hpp"

#include "LuaConfig.h"
#include "ConfValue.h"

namespace bamrelay {

    class BamrelayConf {
    private:
        int _serverconf_ok;
        std::unordered_map<std::string, std::shared_ptr<ConfValue>> _values;
        std::shared_ptr<CLI::App> _bamrelayOpts;

        template<typename T>
        void add_value(const std::string &prefix, const std::string &name, T defaultval, const std::string &description) {
            std::string optionname = "--" + name;
            std::string envname = strtoupper(prefix) + "_" + strtoupper(name);
            _values[name] = std::make_shared<ConfValue>(prefix, name, optionname, defaultval, description, envname, _bamrelayOpts);
        }

    public:
        /*!
         * Collects the configuration parameters. The configuration parameters are provided by
         * - a Lua configuration file (option "--config")
         * - environment variables (PREFIX_NAME)
         * - command line parameters (--name)
         * The parameters in the configuration file have the lowest priority, the command line
         * parameters the highest.
         */
        BamrelayConf();

        void add_config(const std::string &prefix, const std::string &name, bool defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, int defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, float defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, const char *defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, const std::string &defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, const DataSize &defaultval, const std::string &description);

        void add_config(const std::string &prefix, const std::string &name, spdlog::level::level_enum defaultval, const std::string &description);

        /*!
         * Adds routes. The value is stored under the name "prefix_name" with the option "--prefix_name"
         * and the environment variable PREFIX_NAME.
         */
        void add_config(const std::string &prefix, const std::string &name, const std::vector<RouteInfo> &defaultval, const std::string &description);

        /*!
         * Parses the command line, the environment and, if "--config" is given, the Lua
         * configuration file.
         *
         * \returns true if the server should be started. False if the program has to exit with
         * the code returned by serverconf_ok() (--help or a parse error).
         *
         * \throws Error if the configuration file is invalid
         */
        bool parse_cmdline_args(int argc, const char *argv[]);

        /*!
         * Exit code if parse_cmdline_args() returned false, 0 otherwise
         */
        [[nodiscard]] inline int serverconf_ok() const { return _serverconf_ok; }

        inline const std::unordered_map<std::string, std::shared_ptr<ConfValue>> &get_values() const { return _values; }

        [[nodiscard]] std::optional<bool> get_bool(const std::string &name) const;

        [[nodiscard]] std::optional<int> get_int(const std::string &name) const;

        [[nodiscard]] std::optional<float> get_float(const std::string &name) const;

        [[nodiscard]] std::optional<std::string> get_string(const std::string &name) const;

        [[nodiscard]] std::optional<DataSize> get_datasize(const std::string &name) const;

        [[nodiscard]] std::optional<std::vector<RouteInfo>> get_luaroutes(const std::string &prefix, const std::string &name) const;

        [[nodiscard]] std::optional<spdlog::level::level_enum> get_loglevel(const std::string &name) const;
    };

}

#endif //BAMRELAY_BAMRELAYCONF_H
