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
#include <algorithm>
#include <cctype>
#include <utility>

#include "fmt/format.h"

#include "ConfValue.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    size_t data_volume(const std::string &volstr) {
        std::string s = trim_copy(volstr);
        size_t l = s.length();
        if ((l > 1) && (toupper(s[l - 1]) == 'B')) {
            s.erase(--l);
        }
        size_t factor = 1;
        if (l > 1) {
            switch (toupper(s[l - 1])) {
                case 'K': factor = 1024ull; break;
                case 'M': factor = 1024ull * 1024ull; break;
                case 'G': factor = 1024ull * 1024ull * 1024ull; break;
                case 'T': factor = 1024ull * 1024ull * 1024ull * 1024ull; break;
                default: break;
            }
            if (factor > 1) s.erase(--l);
        }
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw Error(file_, __LINE__, "Invalid data volume: \"" + volstr + "\"");
        }
        try {
            return static_cast<size_t>(std::stoull(s)) * factor;
        } catch (const std::out_of_range &) {
            throw Error(file_, __LINE__, "Data volume out of range: \"" + volstr + "\"");
        }
    }
    //=========================================================================

    std::string data_volume(size_t size) {
        static const char *units[] = {"KB", "MB", "GB", "TB"};
        if (size == 0) return "0B";
        int unit = -1;
        while ((unit < 3) && (size % 1024 == 0)) {
            size /= 1024;
            unit++;
        }
        return (unit < 0) ? fmt::format("{}B", size) : fmt::format("{}{}", size, units[unit]);
    }
    //=========================================================================

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         bool bvalue,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(BOOL),
              _bool_value(bvalue),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        app->add_option(_optionname, _bool_value, _description)
                ->envname(_envname);
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         int ivalue,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(INTEGER),
              _int_value(ivalue),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        app->add_option(_optionname, _int_value, _description)
                ->envname(_envname)
                ->check(CLI::TypeValidator<int>());
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         float fvalue,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(FLOAT),
              _float_value(fvalue),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        app->add_option(_optionname, _float_value, _description)
                ->envname(_envname)
                ->check(CLI::Number);
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         const char *cstr,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : ConfValue(std::move(prefix), std::move(confname), std::move(optionname), std::string(cstr),
                        std::move(description), std::move(envname), app) {}

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         std::string str,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(STRING),
              _string_value(std::move(str)),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        app->add_option(_optionname, _string_value, _description)
                ->envname(_envname);
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         const DataSize &ds,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(DATASIZE),
              _datasize_value(ds),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        app->add_option(_optionname, _datasize_value.size_ref(), _description)
                ->envname(_envname)
                ->transform(CLI::AsSizeValue(false));
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         spdlog::level::level_enum loglevel,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(LOGLEVEL),
              _loglevel_value(loglevel),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        std::vector<std::pair<std::string, spdlog::level::level_enum>> logLevelMap{
                {"TRACE",    spdlog::level::trace},
                {"DEBUG",    spdlog::level::debug},
                {"INFO",     spdlog::level::info},
                {"WARN",     spdlog::level::warn},
                {"ERR",      spdlog::level::err},
                {"CRITICAL", spdlog::level::critical},
                {"OFF",      spdlog::level::off}
        };
        app->add_option(_optionname, _loglevel_value, _description)
                ->envname(_envname)
                ->transform(CLI::CheckedTransformer(logLevelMap, CLI::ignore_case));
    }

    ConfValue::ConfValue(std::string prefix,
                         std::string confname,
                         std::string optionname,
                         const std::vector<RouteInfo> &lua_routes,
                         std::string description,
                         std::string envname,
                         const std::shared_ptr<CLI::App> &app)
            : _prefix(std::move(prefix)),
              _confname(std::move(confname)),
              _optionname(std::move(optionname)),
              _value_type(LUAROUTES),
              _description(std::move(description)),
              _envname(std::move(envname)) {
        for (auto &r: lua_routes) { _luaroutes_value.push_back(r.to_string()); }
        app->add_option(_optionname, _luaroutes_value, _description)
                ->envname(_envname);
    }
    //=========================================================================

    std::optional<std::vector<RouteInfo>> ConfValue::get_luaroutes() const {
        if (_value_type != LUAROUTES) return {};
        std::vector<RouteInfo> routes{};
        for (auto &rstr: _luaroutes_value) {
            for (auto &part: split(rstr, ';')) {
                if (!trim_copy(part).empty()) routes.emplace_back(part);
            }
        }
        return routes;
    }
    //=========================================================================

    std::ostream &operator<<(std::ostream &os, const std::shared_ptr<ConfValue> &p) {
        switch (p->_value_type) {
            case ConfValue::DataType::BOOL: return os << "BOOL: " << (p->_bool_value ? "true" : "false");
            case ConfValue::DataType::INTEGER: return os << "INTEGER: " << p->_int_value;
            case ConfValue::DataType::FLOAT: return os << "FLOAT: " << p->_float_value;
            case ConfValue::DataType::STRING: return os << "STRING: " << p->_string_value;
            case ConfValue::DataType::DATASIZE: return os << "DATASIZE: " << p->_datasize_value.as_string();
            case ConfValue::DataType::LOGLEVEL: return os << "LOGLEVEL: " << loglevel_to_string(p->_loglevel_value);
            case ConfValue::DataType::LUAROUTES: {
                std::string routes;
                for (auto &r: p->_luaroutes_value) {
                    routes += r + " ";
                }
                return os << "LUAROUTES: " << routes;
            }
        }
        return os;
    }

}
