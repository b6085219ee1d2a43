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
#ifndef BAMRELAY_CONFVALUE_H
#define BAMRELAY_CONFVALUE_H

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/common.h"
#include "CLI/CLI.hpp"

#include "LuaConfig.h"
#include "Global.h"

namespace bamrelay {

    /*!
     * Converts a data volume string such as "256KB", "4M", "1GB" or "1234" into bytes. Units
     * are binary (1KB = 1024 bytes).
     *
     * \throws Error if the string is not a valid data volume
     */
    extern size_t data_volume(const std::string &volstr);

    /*!
     * Formats a number of bytes with the largest unit that divides it without remainder
     */
    extern std::string data_volume(size_t size);

    class DataSize {
    private:
        size_t size;

    public:
        inline DataSize() : size(0) {}

        inline explicit DataSize(size_t size) : size(size) {}

        inline explicit DataSize(const char *size_str) { size = data_volume(size_str); }

        inline explicit DataSize(const std::string &size_str) { size = data_volume(size_str); }

        inline bool operator==(const DataSize &other) const { return size == other.size; }

        [[nodiscard]] inline std::string as_string() const { return data_volume(size); }

        [[nodiscard]] inline size_t as_size_t() const { return size; }

        inline size_t &size_ref() { return size; }
    };

    /*!
     * \brief One configuration parameter
     *
     * A ConfValue binds itself to a command line option of a CLI::App which also reads the
     * given environment variable. The value can afterwards be replaced by a value from the Lua
     * configuration file (see BamrelayConf::parse_cmdline_args). Instances are held by shared_ptr,
     * the CLI::App keeps pointers to the members.
     */
    class ConfValue {
    public:
        enum DataType {
            BOOL, INTEGER, FLOAT, STRING, DATASIZE, LOGLEVEL, LUAROUTES
        };
    private:
        std::string _prefix;      //!< Name of the Lua table holding the value
        std::string _confname;    //!< Name of the value within the Lua table
        std::string _optionname;  //!< Command line option, e.g. "--port"
        DataType _value_type;
        bool _bool_value{};
        int _int_value{};
        float _float_value{};
        std::string _string_value{};
        DataSize _datasize_value{};
        spdlog::level::level_enum _loglevel_value{};
        std::vector<std::string> _luaroutes_value{};
        std::string _description{};
        std::string _envname{};

    public:
        ConfValue(std::string prefix, std::string confname, std::string optionname, bool bvalue,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, int ivalue,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, float fvalue,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, const char *cstr,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, std::string str,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, const DataSize &ds,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, spdlog::level::level_enum loglevel,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(std::string prefix, std::string confname, std::string optionname, const std::vector<RouteInfo> &lua_routes,
                  std::string description, std::string envname, const std::shared_ptr<CLI::App> &app);

        ConfValue(const ConfValue &cv) = delete;

        ConfValue &operator=(const ConfValue &cv) = delete;

        [[nodiscard]] inline std::string get_prefix() const { return _prefix; }

        [[nodiscard]] inline std::string get_confname() const { return _confname; }

        [[nodiscard]] inline std::string get_optionname() const { return _optionname; }

        [[nodiscard]] inline DataType get_type() const { return _value_type; }

        [[nodiscard]] inline std::optional<bool> get_bool() const {
            if (_value_type == BOOL) return _bool_value;
            return {};
        }

        [[nodiscard]] inline std::optional<int> get_int() const {
            if (_value_type == INTEGER) return _int_value;
            return {};
        }

        [[nodiscard]] inline std::optional<float> get_float() const {
            if (_value_type == FLOAT) return _float_value;
            return {};
        }

        [[nodiscard]] inline std::optional<std::string> get_string() const {
            if (_value_type == STRING) return _string_value;
            return {};
        }

        [[nodiscard]] inline std::optional<DataSize> get_datasize() const {
            if (_value_type == DATASIZE) return _datasize_value;
            return {};
        }

        [[nodiscard]] inline std::optional<spdlog::level::level_enum> get_loglevel() const {
            if (_value_type == LOGLEVEL) return _loglevel_value;
            return {};
        }

        [[nodiscard]] inline std::optional<std::string> get_loglevel_as_string() const {
            if (_value_type == LOGLEVEL) return loglevel_to_string(_loglevel_value);
            return {};
        }

        /*!
         * Returns the routes. A single string with routes separated by ";" (as given by an
         * environment variable) is split into its routes.
         */
        [[nodiscard]] std::optional<std::vector<RouteInfo>> get_luaroutes() const;

        inline void set_value(bool bval) {
            _bool_value = bval;
            _value_type = BOOL;
        }

        inline void set_value(int ival) {
            _int_value = ival;
            _value_type = INTEGER;
        }

        inline void set_value(float fval) {
            _float_value = fval;
            _value_type = FLOAT;
        }

        inline void set_value(const std::string &strval) {
            _string_value = strval;
            _value_type = STRING;
        }

        inline void set_value(const DataSize &dsval) {
            _datasize_value = dsval;
            _value_type = DATASIZE;
        }

        inline void set_value(spdlog::level::level_enum loglevel_val) {
            _loglevel_value = loglevel_val;
            _value_type = LOGLEVEL;
        }

        inline void set_value(const std::vector<RouteInfo> &lua_routes) {
            _luaroutes_value.clear();
            for (auto &r: lua_routes) { _luaroutes_value.push_back(r.to_string()); }
            _value_type = LUAROUTES;
        }

        [[nodiscard]] inline std::string get_description() const { return _description; }

        [[nodiscard]] inline std::string get_envname() const { return _envname; }

        friend std::ostream &operator<<(std::ostream &os, const std::shared_ptr<ConfValue> &p);
    };

    std::ostream &operator<<(std::ostream &os, const std::shared_ptr<ConfValue> &p);

}

#endif //BAMRELAY_CONFVALUE_H
