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
#include "catch2/catch_all.hpp"

#include <cstdlib>

#include "CLI/CLI.hpp"
#include "Global.h"
#include "Error.h"
#include "LuaConfig.h"
#include "ConfValue.h"
#include "BamrelayConf.h"

TEST_CASE("DataSize class", "[DataSize]") {
    bamrelay::DataSize ds1(static_cast<size_t>(100));
    REQUIRE(ds1.as_size_t() == 100);
    bamrelay::DataSize ds2("100");
    REQUIRE(ds2.as_size_t() == 100);
    bamrelay::DataSize ds3("100KB");
    REQUIRE(ds3.as_size_t() == 100 * 1024);
    bamrelay::DataSize ds4("100MB");
    REQUIRE(ds4.as_size_t() == 100 * 1024 * 1024);
    bamrelay::DataSize ds5("100GB");
    REQUIRE(ds5.as_size_t() == 100ll * 1024ll * 1024ll * 1024ll);
    bamrelay::DataSize ds6("100TB");
    REQUIRE(ds6.as_size_t() == 100ll * 1024ll * 1024ll * 1024ll * 1024ll);
    bamrelay::DataSize ds7("256k");
    REQUIRE(ds7.as_size_t() == 256 * 1024);
    REQUIRE_THROWS_AS(bamrelay::DataSize("100GAGA"), bamrelay::Error);
    REQUIRE_THROWS_AS(bamrelay::DataSize(""), bamrelay::Error);
    REQUIRE_THROWS_AS(bamrelay::DataSize("KB"), bamrelay::Error);

    REQUIRE(bamrelay::data_volume(static_cast<size_t>(0)) == "0B");
    REQUIRE(bamrelay::data_volume(static_cast<size_t>(1000)) == "1000B");
    REQUIRE(bamrelay::data_volume(static_cast<size_t>(256 * 1024)) == "256KB");
    REQUIRE(bamrelay::data_volume(static_cast<size_t>(1024 * 1024)) == "1MB");
    REQUIRE(bamrelay::DataSize("2TB").as_string() == "2TB");
}

TEST_CASE("Testing ConfValue class", "[ConfValue]") {
    SECTION("Integer testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::string description = "This is a description";
        std::string envname = "ITEST";
        int idefval = 4711;
        auto ival = bamrelay::ConfValue("bamrelay", "itest", "--itest", idefval, description, envname, app);
        REQUIRE(ival.get_int().value() == idefval);
        REQUIRE(ival.get_description() == description);
        REQUIRE(ival.get_envname() == envname);
        REQUIRE(ival.get_type() == bamrelay::ConfValue::INTEGER);
        int argc = 3;
        char const *argv[] = {"test", "--itest", "42"};
        app->parse(argc, argv);
        REQUIRE(ival.get_int().value() == 42);
        REQUIRE_THROWS_AS(ival.get_bool().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(ival.get_float().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(ival.get_string().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(ival.get_datasize().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(ival.get_loglevel().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(ival.get_luaroutes().value(), std::bad_optional_access);
    }

    SECTION("Boolean testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        auto bval = bamrelay::ConfValue("objecthandler", "s3pathstyle", "--s3pathstyle", false, "Path style", "BTEST", app);
        REQUIRE_FALSE(bval.get_bool().value());
        int argc = 3;
        char const *argv[] = {"test", "--s3pathstyle", "true"};
        app->parse(argc, argv);
        REQUIRE(bval.get_bool().value());
        REQUIRE_THROWS_AS(bval.get_int().value(), std::bad_optional_access);
    }

    SECTION("Float testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::string description = "This is a description";
        std::string envname = "FTEST";
        float fdefval = 3.1415f;
        auto fval = bamrelay::ConfValue("bamrelay", "ftest", "--ftest", fdefval, description, envname, app);
        REQUIRE(fval.get_float().value() == fdefval);
        int argc = 3;
        char const *argv[] = {"test", "--ftest", "2.71"};
        app->parse(argc, argv);
        REQUIRE(fval.get_float().value() == 2.71f);
        REQUIRE_THROWS_AS(fval.get_int().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(fval.get_string().value(), std::bad_optional_access);
    }

    SECTION("String testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::string description = "This is a description";
        std::string envname = "STEST";
        std::string sdefval = "Teststring";
        auto sval = bamrelay::ConfValue("bamrelay", "stest", "--stest", sdefval, description, envname, app);
        REQUIRE(sval.get_string().value() == sdefval);
        int argc = 3;
        char const *argv[] = {"test", "--stest", "Another string"};
        app->parse(argc, argv);
        REQUIRE(sval.get_string().value() == std::string("Another string"));
        REQUIRE_THROWS_AS(sval.get_int().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(sval.get_datasize().value(), std::bad_optional_access);
    }

    SECTION("DataSize testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::string description = "This is a description";
        std::string envname = "DSTEST";
        bamrelay::DataSize dsdefval("256KB");
        auto dsval = bamrelay::ConfValue("objecthandler", "chunksize", "--chunksize", dsdefval, description, envname, app);
        REQUIRE(dsval.get_datasize().value() == dsdefval);
        int argc = 3;
        char const *argv[] = {"test", "--chunksize", "1MB"};
        app->parse(argc, argv);
        REQUIRE(dsval.get_datasize().value().as_size_t() == 1024 * 1024);
        REQUIRE_THROWS_AS(dsval.get_int().value(), std::bad_optional_access);
        REQUIRE_THROWS_AS(dsval.get_string().value(), std::bad_optional_access);
    }

    SECTION("loglevel testing") {
        std::vector<spdlog::level::level_enum> all{
                spdlog::level::level_enum::trace,
                spdlog::level::level_enum::debug,
                spdlog::level::level_enum::info,
                spdlog::level::level_enum::warn,
                spdlog::level::level_enum::err,
                spdlog::level::level_enum::critical,
                spdlog::level::level_enum::off
        };
        std::vector<std::string> allstr{
                "TRACE", "DEBUG", "INFO", "WARN", "ERR", "CRITICAL", "OFF"
        };
        for (size_t i = 0; i < all.size(); i++) {
            std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
            auto llval = bamrelay::ConfValue("bamrelay", "loglevel", "--loglevel", all[i], "Log level", "LLTEST", app);
            REQUIRE(llval.get_loglevel().value() == all[i]);
            REQUIRE(llval.get_loglevel_as_string().value() == allstr[i]);
            size_t ii = (i >= all.size() - 1) ? 0 : i + 1;
            int argc = 3;
            char const *argv[] = {"test", "--loglevel", allstr[ii].c_str()};
            app->parse(argc, argv);
            REQUIRE(llval.get_loglevel().value() == all[ii]);
            REQUIRE(llval.get_loglevel_as_string().value() == allstr[ii]);
            REQUIRE_THROWS_AS(llval.get_int().value(), std::bad_optional_access);
        }
    }

    SECTION("Routes testing") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::vector<bamrelay::RouteInfo> rdefval{
                bamrelay::RouteInfo("GET:/files:s3"),
                bamrelay::RouteInfo("HEAD:/files:s3"),
        };
        auto rval = bamrelay::ConfValue("objecthandler", "routes", "--objecthandler_routes", rdefval, "Routes",
                                        "RTEST", app);
        REQUIRE(rval.get_luaroutes().value() == rdefval);
        int argc = 4;
        char const *argv[] = {"test", "--objecthandler_routes", "GET:/bam:s3", "HEAD:/bam:s3"};
        app->parse(argc, argv);
        auto result = rval.get_luaroutes().value();
        REQUIRE(result.size() == 2);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/bam:s3"));
        REQUIRE(result[1] == bamrelay::RouteInfo("HEAD:/bam:s3"));
        REQUIRE_THROWS_AS(rval.get_string().value(), std::bad_optional_access);
    }

    SECTION("Environment testing for int") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        auto ival = bamrelay::ConfValue("bamrelay", "itest", "--itest", 4711, "Integer", "ITEST", app);
        putenv((char *) "ITEST=1234");
        int argc = 1;
        char const *argv[] = {"test"};
        app->parse(argc, argv);
        REQUIRE(ival.get_int().value() == 1234);
        unsetenv("ITEST");
    }

    SECTION("Environment testing for DataSize") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        auto dsval = bamrelay::ConfValue("bamrelay", "dstest", "--dstest", bamrelay::DataSize("1MB"), "DataSize",
                                         "DSTEST", app);
        putenv((char *) "DSTEST=2GB");
        int argc = 1;
        char const *argv[] = {"test"};
        app->parse(argc, argv);
        REQUIRE(dsval.get_datasize().value().as_string() == std::string("2GB"));
        unsetenv("DSTEST");
    }

    SECTION("Environment testing for loglevel") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        auto llval = bamrelay::ConfValue("bamrelay", "lltest", "--lltest", spdlog::level::level_enum::info, "Level",
                                         "LLTEST", app);
        putenv((char *) "LLTEST=ERR");
        int argc = 1;
        char const *argv[] = {"test"};
        app->parse(argc, argv);
        REQUIRE(llval.get_loglevel().value() == spdlog::level::level_enum::err);
        unsetenv("LLTEST");
    }

    SECTION("Environment testing for routes") {
        std::shared_ptr<CLI::App> app = std::make_shared<CLI::App>();
        std::vector<bamrelay::RouteInfo> rdefval{bamrelay::RouteInfo("GET:/files:s3")};
        auto rval = bamrelay::ConfValue("objecthandler", "routes", "--objecthandler_routes", rdefval, "Routes",
                                        "RTEST", app);
        putenv((char *) "RTEST=GET:/reads:s3;HEAD:/reads:s3");
        int argc = 1;
        char const *argv[] = {"test"};
        app->parse(argc, argv);
        auto result = rval.get_luaroutes().value();
        REQUIRE(result.size() == 2);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/reads:s3"));
        REQUIRE(result[1] == bamrelay::RouteInfo("HEAD:/reads:s3"));
        unsetenv("RTEST");
    }
}

TEST_CASE("Testing RouteInfo", "[RouteInfo]") {
    bamrelay::RouteInfo r1("GET:/files:s3");
    REQUIRE(r1.method == bamrelay::Connection::GET);
    REQUIRE(r1.route == "/files");
    REQUIRE(r1.additional_data == "s3");
    REQUIRE(r1.to_string() == "GET:/files:s3");

    bamrelay::RouteInfo r2("HEAD:/files");
    REQUIRE(r2.method == bamrelay::Connection::HEAD);
    REQUIRE(r2.route == "/files");
    REQUIRE(r2.additional_data.empty());

    REQUIRE_THROWS_AS(bamrelay::RouteInfo("FETCH:/files:s3"), bamrelay::Error);
    REQUIRE_THROWS_AS(bamrelay::RouteInfo("GET::s3"), bamrelay::Error);
}

static void add_test_config(bamrelay::BamrelayConf &config) {
    const std::string prefix{"bamrelay"};
    config.add_config(prefix, "config", "", "Config file");
    config.add_config(prefix, "itest", 4711, "Test integer parameter [default=4711]");
    config.add_config(prefix, "ftest", 3.1415f, "Test float parameter [default=3.1415]");
    config.add_config(prefix, "stest", "test", "Test string parameter [default=test]");
    config.add_config(prefix, "btest", false, "Test boolean parameter [default=false]");
    config.add_config(prefix, "dstest", bamrelay::DataSize("1MB"), "Test datasize parameter [default=1MB]");
    config.add_config(prefix, "lltest", spdlog::level::level_enum::info, "Test loglevel parameter [default=INFO]");
    std::vector<bamrelay::RouteInfo> routes{
            bamrelay::RouteInfo("GET:/files:s3"),
            bamrelay::RouteInfo("HEAD:/files:s3"),
    };
    config.add_config("objecthandler", "routes", routes, "Test routes [default=\"GET:/files:s3\" \"HEAD:/files:s3\"]");
}

TEST_CASE("Testing BamrelayConf class", "[BamrelayConf]") {
    SECTION("Default values") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        int argc = 1;
        const char *argv[] = {"test"};
        REQUIRE(config.parse_cmdline_args(argc, argv));

        REQUIRE(config.get_int("itest").value() == 4711);
        REQUIRE(config.get_float("ftest").value() == 3.1415f);
        REQUIRE(config.get_string("stest").value() == std::string("test"));
        REQUIRE_FALSE(config.get_bool("btest").value());
        REQUIRE(config.get_datasize("dstest").value() == bamrelay::DataSize("1MB"));
        REQUIRE(config.get_loglevel("lltest").value() == spdlog::level::level_enum::info);
        auto result = config.get_luaroutes("objecthandler", "routes").value();
        REQUIRE(result.size() == 2);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/files:s3"));
        REQUIRE(result[1] == bamrelay::RouteInfo("HEAD:/files:s3"));
        REQUIRE_FALSE(config.get_int("unknown").has_value());
        REQUIRE_FALSE(config.get_luaroutes("pinghandler", "routes").has_value());
    }

    SECTION("Command line options") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        int argc = 15;
        const char *argv[] = {"test",
                              "--itest", "42",
                              "--ftest", "2.71",
                              "--stest", "Waseliwas soll das?",
                              "--btest", "true",
                              "--dstest", "2TB",
                              "--lltest", "ERR",
                              "--objecthandler_routes", "GET:/reads:s3"};
        REQUIRE(config.parse_cmdline_args(argc, argv));

        REQUIRE(config.get_int("itest").value() == 42);
        REQUIRE(config.get_float("ftest").value() == 2.71f);
        REQUIRE(config.get_string("stest").value() == std::string("Waseliwas soll das?"));
        REQUIRE(config.get_bool("btest").value());
        REQUIRE(config.get_datasize("dstest").value() == bamrelay::DataSize("2TB"));
        REQUIRE(config.get_loglevel("lltest").value() == spdlog::level::level_enum::err);
        auto result = config.get_luaroutes("objecthandler", "routes").value();
        REQUIRE(result.size() == 1);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/reads:s3"));
    }

    SECTION("Environment variables") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        putenv((char *) "BAMRELAY_ITEST=42");
        putenv((char *) "BAMRELAY_STEST=Waseliwas soll das?");
        putenv((char *) "BAMRELAY_DSTEST=2TB");
        putenv((char *) "BAMRELAY_LLTEST=ERR");
        putenv((char *) "OBJECTHANDLER_ROUTES=GET:/reads:s3;HEAD:/reads:s3");
        int argc = 1;
        const char *argv[] = {"test"};
        REQUIRE(config.parse_cmdline_args(argc, argv));

        REQUIRE(config.get_int("itest").value() == 42);
        REQUIRE(config.get_string("stest").value() == std::string("Waseliwas soll das?"));
        REQUIRE(config.get_datasize("dstest").value() == bamrelay::DataSize("2TB"));
        REQUIRE(config.get_loglevel("lltest").value() == spdlog::level::level_enum::err);
        auto result = config.get_luaroutes("objecthandler", "routes").value();
        REQUIRE(result.size() == 2);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/reads:s3"));
        REQUIRE(result[1] == bamrelay::RouteInfo("HEAD:/reads:s3"));
        unsetenv("BAMRELAY_ITEST");
        unsetenv("BAMRELAY_STEST");
        unsetenv("BAMRELAY_DSTEST");
        unsetenv("BAMRELAY_LLTEST");
        unsetenv("OBJECTHANDLER_ROUTES");
    }

    SECTION("Lua configuration file") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        int argc = 3;
        const char *argv[] = {"test", "--config", "./testdata/test-config.lua"};
        REQUIRE(config.parse_cmdline_args(argc, argv));

        REQUIRE(config.get_int("itest").value() == 1234);
        REQUIRE(config.get_float("ftest").value() == 0.123f);
        REQUIRE(config.get_string("stest").value() == std::string("from lua"));
        REQUIRE(config.get_bool("btest").value());
        REQUIRE(config.get_datasize("dstest").value() == bamrelay::DataSize("8KB"));
        REQUIRE(config.get_loglevel("lltest").value() == spdlog::level::level_enum::off);
        auto result = config.get_luaroutes("objecthandler", "routes").value();
        REQUIRE(result.size() == 1);
        REQUIRE(result[0] == bamrelay::RouteInfo("GET:/lualua:s3"));
    }

    SECTION("Command line takes precedence over the configuration file") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        int argc = 5;
        const char *argv[] = {"test", "--config", "./testdata/test-config.lua", "--itest", "42"};
        REQUIRE(config.parse_cmdline_args(argc, argv));
        REQUIRE(config.get_int("itest").value() == 42);
        REQUIRE(config.get_string("stest").value() == std::string("from lua"));
    }

    SECTION("Invalid option") {
        bamrelay::BamrelayConf config;
        add_test_config(config);
        int argc = 3;
        const char *argv[] = {"test", "--itest", "notanumber"};
        REQUIRE_FALSE(config.parse_cmdline_args(argc, argv));
        REQUIRE(config.serverconf_ok() != 0);
    }
}

TEST_CASE("Testing LuaConfig class", "[LuaConfig]") {
    bamrelay::LuaConfig luacfg("objecthandler = { s3bucket = 'genomes', chunktimeout = 10, "
                               "routes = 'GET:/bam:s3;HEAD:/bam:s3' }", true);
    REQUIRE(luacfg.configString("objecthandler", "s3bucket", "") == "genomes");
    REQUIRE(luacfg.configString("objecthandler", "s3region", "us-east-1") == "us-east-1");
    REQUIRE(luacfg.configInteger("objecthandler", "chunktimeout", 30) == 10);
    REQUIRE(luacfg.configInteger("nosuchtable", "chunktimeout", 30) == 30);
    auto routes = luacfg.configRoute("objecthandler", "routes", {});
    REQUIRE(routes.size() == 2);
    REQUIRE(routes[1] == bamrelay::RouteInfo("HEAD:/bam:s3"));

    REQUIRE_THROWS_AS(bamrelay::LuaConfig("this is { not lua", true), bamrelay::Error);
}
