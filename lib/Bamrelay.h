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
/*!
 * \brief Implements a simple multithreaded HTTP server that dispatches requests to handlers.
 */
#ifndef BAMRELAY_BAMRELAY_H
#define BAMRELAY_BAMRELAY_H

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "openssl/bio.h"
#include "openssl/ssl.h"
#include "openssl/err.h"

#include "spdlog/spdlog.h"

#include "Global.h"
#include "Error.h"
#include "Connection.h"
#include "ThreadControl.h"
#include "SocketControl.h"
#include "RequestHandler.h"

namespace bamrelay {

    /*!
     * Result of processing one request on a socket
     */
    typedef enum {
        CONTINUE, //!< keep the socket open for the next request
        CLOSE,    //!< close the socket orderly
        ABORT     //!< the response is incomplete: reset the connection
    } ThreadStatus;

    /*!
     * \brief The HTTP server
     *
     * The main thread polls the listening sockets and all idle client sockets. A client socket
     * with input is handed over to a free worker thread which reads and processes exactly one
     * request and then returns the socket (or asks to close or reset it).
     *
     *     bamrelay::Server server(8080, 4);
     *     server.addRoute(Connection::GET, "/ping", ping_handler);
     *     server.run();
     */
    class Server {
        class SSLError : public Error {
        protected:
            SSL *cSSL{};
        public:
            inline SSLError(const char *file, const int line, const char *msg, SSL *cSSL_p = nullptr)
                    : Error(file, line, msg), cSSL(cSSL_p) {};

            inline SSLError(const char *file, const int line, const std::string &msg, SSL *cSSL_p = nullptr)
                    : Error(file, line, msg), cSSL(cSSL_p) {};

            [[nodiscard]] inline std::string to_string() const override {
                std::stringstream ss;
                ss << "SSL-ERROR at [" << file << ": " << line << "] ";
                BIO *bio = BIO_new(BIO_s_mem());
                ERR_print_errors(bio);
                char *buf = nullptr;
                long n = BIO_get_mem_data (bio, &buf);
                if (n > 0) {
                    ss << std::string(buf, n) << " : ";
                }
                BIO_free(bio);
                ss << message;
                return ss.str();
            };
        };

    public:
        static std::string _loggername; //!< global logger name
        static std::shared_ptr<spdlog::logger> _logger; //!< shared pointer to logger

    private:
        int _port; //!< listening Port for server
        int _ssl_port; //!< listening port for openssl, -1 if disabled
        int _sockfd; //!< socket id
        int _ssl_sockfd; //!< SSL socket id

        std::string _ssl_certificate; //!< Path to SSL certificate
        std::string _ssl_key; //!< Path to SSL key

        int stoppipe[2]{};

        unsigned _nthreads; //!< maximum number of parallel threads for processing requests
        int _keep_alive_timeout; //!< idle keep-alive connections are closed after this number of seconds
        int _io_timeout; //!< send/receive timeout of client sockets in seconds
        std::atomic<bool> running; //!< Main runloop should keep on going
        std::map<std::string, std::shared_ptr<RequestHandler>> handler[Connection::NumHttpMethods]; //!< request handlers per method
        std::shared_ptr<RequestHandler> default_handler;

        SocketControl::SocketInfo accept_connection(int sock, bool ssl = false);

    public:
        /*!
         * Create an instance of the HTTP server.
         *
         * @param port Port number to listen on for incoming connections
         * @param nthreads Number of parallel threads that will be used to serve the requests.
         *                 If there are more requests then this number, these requests will
         *                 be put on hold until a thread is free
         * @param userid_str User id the server runs on. This requires the server is started as
         *                   root. If the string is empty, the server is run as the user that is
         *                   starting the server.
         */
        explicit Server(int port, unsigned nthreads = 4, const std::string &userid_str = "");

        Server(const Server &) = delete;

        Server &operator=(const Server &) = delete;

        [[maybe_unused]] inline static void loggername(const std::string &loggername) { _loggername = loggername; }

        [[maybe_unused]] inline static const std::string &loggername() { return _loggername; }

        /*!
         * Creates the global logger. It logs to the console and, if logfile is not empty, to the file.
         */
        static std::shared_ptr<spdlog::logger> create_logger(spdlog::level::level_enum level = spdlog::level::info,
                                                             bool consolelog = true,
                                                             const std::string &logfile = "");

        static std::shared_ptr<spdlog::logger> logger(spdlog::level::level_enum level = spdlog::level::info);

        [[maybe_unused]] [[nodiscard]] inline int port() const { return _port; }

        inline void ssl_port(int ssl_port_p) { _ssl_port = ssl_port_p; }

        [[maybe_unused]] [[nodiscard]] inline int ssl_port() const { return _ssl_port; }

        inline void ssl_certificate(const std::string &path) { _ssl_certificate = path; }

        [[maybe_unused]] inline std::string ssl_certificate() const { return _ssl_certificate; }

        inline void ssl_key(const std::string &path) { _ssl_key = path; }

        [[maybe_unused]] inline std::string ssl_key() const { return _ssl_key; }

        static std::string version_string();

        [[maybe_unused]] [[nodiscard]] inline unsigned nthreads() const { return _nthreads; }

        inline void keep_alive_timeout(int keep_alive_timeout) { _keep_alive_timeout = keep_alive_timeout; }

        [[nodiscard]] inline int keep_alive_timeout() const { return _keep_alive_timeout; }

        inline void io_timeout(int io_timeout_p) { _io_timeout = io_timeout_p; }

        [[nodiscard]] inline int io_timeout() const { return _io_timeout; }

        /*!
         * Runs the server until stop() is called or SIGINT/SIGTERM is received
         */
        virtual void run();

        /*!
         * Adds a route. The route matches the request path if the path equals the route or
         * continues with a "/" after it. The longest matching route wins.
         */
        void addRoute(Connection::HttpMethod method_p, const std::string &path, std::shared_ptr<RequestHandler> handler_p);

        /*!
         * Get the handler for an incoming request. Returns the handler (nullptr if there is none for
         * the method) and the matching route.
         */
        std::tuple<std::shared_ptr<RequestHandler>, std::string> getHandler(Connection &conn);

        /*!
         * Returns the methods that have a handler for the given path
         */
        std::vector<Connection::HttpMethod> allowedMethods(const std::string &uri);

        /*!
         * Reads one request from the input stream, dispatches it to the handler and writes the
         * response to the output stream.
         *
         * @param ins Input stream of the client socket
         * @param os Output stream of the client socket
         * @param peer_ip IP address of the client
         * @param peer_port Port of the client
         * @param secure true if the connection uses SSL
         * @param keep_alive In: <= 0 forces closing the connection. Out: keep alive timeout
         * @return How the socket has to be treated after the request
         */
        ThreadStatus processRequest(std::istream *ins, std::ostream *os, const std::string &peer_ip, int peer_port,
                                    bool secure, int &keep_alive);

        void stop();
    };

}

#endif //BAMRELAY_BAMRELAY_H
