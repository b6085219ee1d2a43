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
#include "BamrelayConf.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    BamrelayConf::BamrelayConf() {
        _bamrelayOpts = std::make_shared<CLI::App>(
                "bamrelay streams byte ranges of BAM/BAI objects from an S3 object store over HTTP.", "bamrelay");
        _serverconf_ok = 0;
    }
    //=========================================================================

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, bool defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, int defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, float defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, const char *defaultval,
                                  const std::string &description) {
        add_value(prefix, name, std::string(defaultval), description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, const std::string &defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, const DataSize &defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, spdlog::level::level_enum defaultval,
                                  const std::string &description) {
        add_value(prefix, name, defaultval, description);
    }

    void BamrelayConf::add_config(const std::string &prefix, const std::string &name, const std::vector<RouteInfo> &defaultval,
                                  const std::string &description) {
        //
        // routes automatically prepend the prefix to the option name (which usually ist just "routes"). Thus
        // the composed name will be something as "objecthandler_routes"
        //
        std::string fullname = prefix + "_" + name;
        std::string optionname = "--" + fullname;
        std::string envname = strtoupper(prefix) + "_" + strtoupper(name);
        _values[fullname] = std::make_shared<ConfValue>(prefix, name, optionname, defaultval, description, envname,
                                                        _bamrelayOpts);
    }
    //=========================================================================

    bool BamrelayConf::parse_cmdline_args(int argc, const char *argv[]) {
        try {
            _bamrelayOpts->parse(argc, argv);
        } catch (const CLI::ParseError &e) {
            _serverconf_ok = _bamrelayOpts->exit(e);
            return false;
        }

        auto config_value = _values.find("config");
        if ((config_value == _values.end()) || config_value->second->get_string().value_or("").empty()) {
            return true;
        }

        //
        // values given on the command line or by environment variables take precedence over the
        // values in the configuration file
        //
        LuaConfig luacfg(config_value->second->get_string().value());
        for (auto const &[name, val]: _values) {
            if (name == "config") continue;
            if (!_bamrelayOpts->get_option(val->get_optionname())->empty()) continue;
            const std::string table = val->get_prefix();
            const std::string variable = val->get_confname();
            switch (val->get_type()) {
                case ConfValue::BOOL:
                    val->set_value(luacfg.configBoolean(table, variable, val->get_bool().value()));
                    break;
                case ConfValue::INTEGER:
                    val->set_value(luacfg.configInteger(table, variable, val->get_int().value()));
                    break;
                case ConfValue::FLOAT:
                    val->set_value(luacfg.configFloat(table, variable, val->get_float().value()));
                    break;
                case ConfValue::STRING:
                    val->set_value(luacfg.configString(table, variable, val->get_string().value()));
                    break;
                case ConfValue::DATASIZE:
                    val->set_value(DataSize(luacfg.configString(table, variable, val->get_datasize().value().as_string())));
                    break;
                case ConfValue::LOGLEVEL:
                    val->set_value(luacfg.configLoglevel(table, variable, val->get_loglevel().value()));
                    break;
                case ConfValue::LUAROUTES:
                    val->set_value(luacfg.configRoute(table, variable, val->get_luaroutes().value()));
                    break;
            }
        }
        return true;
    }
    //=========================================================================

    std::optional<bool> BamrelayConf::get_bool(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_bool();
    }

    std::optional<int> BamrelayConf::get_int(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_int();
    }

    std::optional<float> BamrelayConf::get_float(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_float();
    }

    std::optional<std::string> BamrelayConf::get_string(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_string();
    }

    std::optional<DataSize> BamrelayConf::get_datasize(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_datasize();
    }

    std::optional<std::vector<RouteInfo>> BamrelayConf::get_luaroutes(const std::string &prefix, const std::string &name) const {
        auto val = _values.find(prefix + "_" + name);
        if (val == _values.end()) return {};
        return val->second->get_luaroutes();
    }

    std::optional<spdlog::level::level_enum> BamrelayConf::get_loglevel(const std::string &name) const {
        auto val = _values.find(name);
        if (val == _values.end()) return {};
        return val->second->get_loglevel();
    }

}
