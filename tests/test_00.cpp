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

#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>

#include <iostream>
#include <memory>
#include <sstream>

#include "Error.h"
#include "SockStream.h"
#include "Connection.h"
#include "Bamrelay.h"

#include "../handlers/pinghandler/PingHandler.h"
#include "MemoryObjectStore.h"

TEST_CASE("Testing Error class", "[Error]") {
    std::string msg("test message");
    bamrelay::Error err(__FILE__, __LINE__, msg); int l = __LINE__;
    REQUIRE(err.getMessage() == msg);
    REQUIRE(err.getLine() == l);
    REQUIRE(err.to_string().find(msg) != std::string::npos);
}

TEST_CASE("Testing socket stream", "[SockStream]") {
    int socketfd[2];
    std::string teststr("0123456789|0123456789|0123456789|0123456789|0123456789|0123456789|0123456789|");
    REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, socketfd) == 0);
    pid_t pid;
    pid = fork();
    if (pid == 0) {
        // child process
        close(socketfd[1]);
        bamrelay::SockStream sockstreamA(socketfd[0], 40, 40);
        std::ostream os(&sockstreamA);
        os << teststr;
        os.flush();
        close(socketfd[0]);
        _exit(0);
    } else {
        // master process
        close(socketfd[0]);
        bamrelay::SockStream sockstreamB(socketfd[1], 40, 40);
        std::istream is(&sockstreamB);
        std::string result;
        is >> result;
        REQUIRE(result == teststr);
        close(socketfd[1]);
    }
}

TEST_CASE("Testing helper functions", "[Connection]") {
    REQUIRE(bamrelay::urldecode("sample%201/reads.bam") == "sample 1/reads.bam");
    REQUIRE(bamrelay::urldecode("a+b%2Fc") == "a b/c");
    REQUIRE(bamrelay::urldecode("100%") == "100%");

    auto opts = bamrelay::parse_header_options("timeout=5, max=100", ',');
    REQUIRE(opts["timeout"] == "5");
    REQUIRE(opts["max"] == "100");

    std::istringstream is("first line\r\nsecond\nthird\r");
    std::string line;
    bamrelay::safeGetline(is, line);
    REQUIRE(line == "first line");
    bamrelay::safeGetline(is, line);
    REQUIRE(line == "second");
    bamrelay::safeGetline(is, line);
    REQUIRE(line == "third");
}

TEST_CASE("Testing Connection class", "[Connection]") {
    SECTION("Request parsing") {
        std::istringstream ins("GET /files/sample%201/reads.bam?x=1 HTTP/1.1\r\n"
                               "Host: localhost\r\n"
                               "Range: bytes=0-9\r\n"
                               "\r\n");
        std::ostringstream os;
        bamrelay::Connection conn(&ins, &os);
        REQUIRE(conn.method() == bamrelay::Connection::GET);
        REQUIRE(conn.uri() == "/files/sample%201/reads.bam");
        REQUIRE(conn.header("range") == "bytes=0-9");
        REQUIRE(conn.header("RANGE") == "bytes=0-9");
        REQUIRE(conn.hasHeader("host"));
        REQUIRE_FALSE(conn.hasHeader("origin"));
        REQUIRE(conn.header("origin").empty());
        REQUIRE(conn.keepAlive());
    }

    SECTION("Connection close and HTTP/1.0") {
        std::istringstream ins1("GET / HTTP/1.1\r\nConnection: close\r\n\r\n");
        std::ostringstream os1;
        bamrelay::Connection conn1(&ins1, &os1);
        REQUIRE_FALSE(conn1.keepAlive());

        std::istringstream ins2("GET / HTTP/1.0\r\n\r\n");
        std::ostringstream os2;
        bamrelay::Connection conn2(&ins2, &os2);
        REQUIRE_FALSE(conn2.keepAlive());
    }

    SECTION("Empty input and malformed request line") {
        std::istringstream ins1("");
        std::ostringstream os1;
        REQUIRE_THROWS_AS(bamrelay::Connection(&ins1, &os1), bamrelay::InputFailure);

        std::istringstream ins2("garbage\r\n\r\n");
        std::ostringstream os2;
        REQUIRE_THROWS_AS(bamrelay::Connection(&ins2, &os2), bamrelay::Error);
    }

    SECTION("Header and streamed body") {
        std::istringstream ins("GET /x HTTP/1.1\r\n\r\n");
        std::ostringstream os;
        {
            bamrelay::Connection conn(&ins, &os);
            conn.status(bamrelay::Connection::PARTIAL_CONTENT);
            conn.header("Content-Range", "bytes 0-9/100");
            conn.sendHeader(10);
            REQUIRE(conn.headerSent());
            REQUIRE_THROWS_AS(conn.header("X-Late", "value"), bamrelay::Error);
            conn.sendData("01234", 5);
            conn.sendData("56789", 5);
        }
        auto [header, body] = bamrelay::split_response(os.str());
        REQUIRE(header.rfind("HTTP/1.1 206 Partial Content\r\n", 0) == 0);
        REQUIRE(header.find("Content-Range: bytes 0-9/100\r\n") != std::string::npos);
        REQUIRE(header.find("Content-Length: 10\r\n") != std::string::npos);
        REQUIRE(body == "0123456789");
    }

    SECTION("HEAD suppresses the body") {
        std::istringstream ins("HEAD /x HTTP/1.1\r\n\r\n");
        std::ostringstream os;
        {
            bamrelay::Connection conn(&ins, &os);
            conn.sendHeader(10);
            conn.sendData("0123456789", 10);
        }
        auto [header, body] = bamrelay::split_response(os.str());
        REQUIRE(header.find("Content-Length: 10\r\n") != std::string::npos);
        REQUIRE(body.empty());
    }

    SECTION("Buffered output") {
        std::istringstream ins("GET /x HTTP/1.1\r\n\r\n");
        std::ostringstream os;
        {
            bamrelay::Connection conn(&ins, &os);
            conn.setBuffer();
            conn << "Hello " << "World" << bamrelay::Connection::flush_data;
        }
        auto [header, body] = bamrelay::split_response(os.str());
        REQUIRE(header.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        REQUIRE(header.find("Content-Length: 11\r\n") != std::string::npos);
        REQUIRE(body == "Hello World");
    }

    SECTION("Failing client connection") {
        std::istringstream ins("GET /x HTTP/1.1\r\n\r\n");
        bamrelay::LimitedSink sink(100);
        std::ostream os(&sink);
        bamrelay::Connection conn(&ins, &os);
        conn.sendHeader(1000);
        std::string chunk(200, 'x');
        REQUIRE_THROWS_AS(conn.sendData(chunk.data(), chunk.size()), bamrelay::InputFailure);
        conn.abort();
        REQUIRE(conn.aborted());
        REQUIRE_FALSE(conn.keepAlive());
    }

    SECTION("CORS preflight") {
        std::istringstream ins("OPTIONS /files/a.bam HTTP/1.1\r\n"
                               "Origin: https://igv.org\r\n"
                               "Access-Control-Request-Method: GET\r\n"
                               "Access-Control-Request-Headers: range\r\n"
                               "\r\n");
        std::ostringstream os;
        {
            bamrelay::Connection conn(&ins, &os);
            REQUIRE(conn.resetConnection());
            conn.sendPreflight();
        }
        auto [header, body] = bamrelay::split_response(os.str());
        REQUIRE(header.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0);
        REQUIRE(header.find("Access-Control-Allow-Origin: https://igv.org\r\n") != std::string::npos);
        REQUIRE(header.find("Access-Control-Allow-Methods: GET, HEAD, OPTIONS\r\n") != std::string::npos);
        REQUIRE(header.find("Access-Control-Allow-Headers: range\r\n") != std::string::npos);
        REQUIRE(body.empty());
    }
}

static bamrelay::ThreadStatus run_request(bamrelay::Server &server, const std::string &request, std::string &response,
                                          int keep_alive = 1) {
    std::istringstream ins(request);
    std::ostringstream os;
    bamrelay::ThreadStatus status = server.processRequest(&ins, &os, "127.0.0.1", 4711, false, keep_alive);
    response = os.str();
    return status;
}

TEST_CASE("Testing request dispatching", "[Server]") {
    bamrelay::Server server(8080, 1);
    auto pinghandler = std::make_shared<bamrelay::PingHandler>();
    server.addRoute(bamrelay::Connection::GET, "/ping", pinghandler);
    std::string response;

    SECTION("Route matching") {
        std::istringstream ins("GET /ping/extra HTTP/1.1\r\n\r\n");
        std::ostringstream os;
        bamrelay::Connection conn(&ins, &os);
        auto [handler, route] = server.getHandler(conn);
        REQUIRE(handler == pinghandler);
        REQUIRE(route == "/ping");

        std::istringstream ins2("GET /pingpong HTTP/1.1\r\n\r\n");
        bamrelay::Connection conn2(&ins2, &os);
        auto [handler2, route2] = server.getHandler(conn2);
        REQUIRE(handler2 == nullptr);
    }

    SECTION("Ping") {
        REQUIRE(run_request(server, "GET /ping HTTP/1.1\r\n\r\n", response) == bamrelay::CONTINUE);
        auto [header, body] = bamrelay::split_response(response);
        REQUIRE(header.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        REQUIRE(header.find("Connection: keep-alive\r\n") != std::string::npos);
        REQUIRE(body == "PONG");
    }

    SECTION("Connection close") {
        REQUIRE(run_request(server, "GET /ping HTTP/1.1\r\nConnection: close\r\n\r\n", response) == bamrelay::CLOSE);
        REQUIRE(response.find("Connection: close\r\n") != std::string::npos);
        REQUIRE(run_request(server, "GET /ping HTTP/1.1\r\n\r\n", response, 0) == bamrelay::CLOSE);
    }

    SECTION("Unknown route") {
        REQUIRE(run_request(server, "GET /nothing/here HTTP/1.1\r\n\r\n", response) == bamrelay::CONTINUE);
        REQUIRE(response.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    }

    SECTION("Method not allowed") {
        REQUIRE(run_request(server, "POST /ping HTTP/1.1\r\nContent-Length: 0\r\n\r\n", response) == bamrelay::CONTINUE);
        auto [header, body] = bamrelay::split_response(response);
        REQUIRE(header.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) == 0);
        REQUIRE(header.find("Allow: GET\r\n") != std::string::npos);
    }

    SECTION("OPTIONS without CORS") {
        REQUIRE(run_request(server, "OPTIONS /ping HTTP/1.1\r\n\r\n", response) == bamrelay::CONTINUE);
        auto [header, body] = bamrelay::split_response(response);
        REQUIRE(header.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0);
        REQUIRE(header.find("Allow: GET\r\n") != std::string::npos);
    }

    SECTION("Bad request and closed socket") {
        REQUIRE(run_request(server, "garbage\r\n\r\n", response) == bamrelay::CLOSE);
        REQUIRE(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
        REQUIRE(run_request(server, "", response) == bamrelay::CLOSE);
        REQUIRE(response.empty());
    }
}
