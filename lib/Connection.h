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
 * \brief Implements the handling of one HTTP request/response on a stream pair.
 */
#ifndef BAMRELAY_CONNECTION_H
#define BAMRELAY_CONNECTION_H

#include <iostream>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Error.h"

namespace bamrelay {

    extern const size_t max_headerline_len;

    /*!
     * Thrown if reading the request or writing the response fails on the socket level. A
     * OUTPUT_WRITE_FAIL means that the client went away (or did not read for longer than
     * the socket send timeout).
     */
    typedef enum {
        INPUT_READ_FAIL = -1, OUTPUT_WRITE_FAIL = -2
    } InputFailure;

    /*!
     * Reads a line which is terminated by "\n", "\r" or "\r\n". The terminator is not returned.
     *
     * \param[in] is Input stream
     * \param[out] t The line read
     * \param[in] max_n Maximal length of the line, 0 for unlimited
     * \returns Number of bytes consumed, 0 on EOF
     */
    extern size_t safeGetline(std::istream &is, std::string &t, size_t max_n = 0);

    extern std::unordered_map<std::string, std::string> parse_header_options(const std::string &options, char sep = ';');

    /*!
     * Decodes %XX escapes of an URL path component
     */
    extern std::string urldecode(const std::string &src);

    /*!
     * \brief Represents one HTTP request/response exchange
     *
     * The constructor reads and parses the request line and the header. The response is either
     *
     * - sent in one go with send() (or the << operator together with setBuffer()), the server
     *   computes the Content-Length, or
     * - committed with sendHeader(content_length) and then streamed with sendData(). This is
     *   used for proxied object bodies of known length.
     *
     * Once the status line has been sent the response can no longer be replaced by an error
     * response. If the body cannot be completed, abort() marks the connection so that the server
     * resets the TCP connection instead of reusing it.
     *
     * For HEAD requests all body bytes are suppressed, the headers (including Content-Length)
     * are sent as for GET.
     */
    class Connection {
    public:
        /*!
         * Request methods
         */
        typedef enum {
            OPTIONS = 0, //!< Allows a client to determine the options and/or requirements associated with a resource
            GET = 1,     //!< Retrieve whatever information is identified by the Request-URI
            HEAD = 2,    //!< Identical to GET except that the server MUST NOT return a message-body in the response.
            POST = 3,
            PUT = 4,
            DELETE = 5,
            TRACE = 6,
            CONNECT = 7,
            OTHER = 8    //!< Fallback....
        } HttpMethod;

        static const int NumHttpMethods = 9;

        typedef enum {
            OK = 200,
            NO_CONTENT = 204,
            PARTIAL_CONTENT = 206,
            BAD_REQUEST = 400,
            UNAUTHORIZED = 401,
            FORBIDDEN = 403,
            NOT_FOUND = 404,
            METHOD_NOT_ALLOWED = 405,
            REQUEST_TIMEOUT = 408,
            REQUEST_RANGE_NOT_SATISFIABLE = 416,
            INTERNAL_SERVER_ERROR = 500,
            NOT_IMPLEMENTED = 501,
            BAD_GATEWAY = 502,
            SERVICE_UNAVAILABLE = 503,
            GATEWAY_TIMEOUT = 504
        } StatusCodes;

        typedef enum {
            flush_data
        } Commands;

        static std::string method_as_string(HttpMethod method);

    private:
        std::string _peer_ip;       //!< IP number of client (peer)
        int _peer_port;             //!< Port of peer/client
        std::string http_version;   //!< Holds the HTTP version of the request
        bool _secure;               //!< true if SSL used
        HttpMethod _method;         //!< request method
        std::string _uri;           //!< uri of the request (without query string)
        std::unordered_map<std::string, std::string> header_in; //!< Input header fields, names in lower case
        std::map<std::string, std::string> header_out;          //!< Output header fields
        std::istream *ins;          //!< incoming data stream
        std::ostream *os;           //!< outgoing data stream
        StatusCodes status_code;    //!< Status code of response
        std::string status_string;  //!< Short description of status code
        bool header_sent;           //!< True if header already sent
        bool _keep_alive;           //!< if true, don't close the socket after the request
        int _keep_alive_timeout;    //!< timeout for connection
        bool _finished;             //!< Transfer of response data finished
        bool _aborted;              //!< Response could not be completed, the connection must be reset
        bool _buffered;             //!< Output is collected in outbuf and sent by flush()
        std::string outbuf;         //!< output buffer used in buffered mode
        bool _reset_connection;     //!< true, if the request was answered already (CORS preflight)

        void process_header();

        void check_output();

        void send_header(size_t n = 0);

        void finalize();

    public:
        /*!
         * Reads the request line and the header from the input stream.
         *
         * \param[in] ins_p Input stream (socket)
         * \param[in] os_p Output stream (socket)
         *
         * \throws InputFailure if the input could not be read (timeout or socket closed)
         * \throws Error if the request line is not a valid HTTP request line
         */
        Connection(std::istream *ins_p, std::ostream *os_p);

        Connection(const Connection &) = delete;

        Connection &operator=(const Connection &) = delete;

        /*!
         * Terminates the response (flushes buffered data) unless the
         * connection was aborted.
         */
        ~Connection();

        inline std::string peer_ip() const { return _peer_ip; }

        inline void peer_ip(const std::string &ip) { _peer_ip = ip; }

        [[nodiscard]] inline int peer_port() const { return _peer_port; }

        inline void peer_port(int port) { _peer_port = port; }

        [[nodiscard]] inline bool secure() const { return _secure; }

        inline void secure(bool sec) { _secure = sec; }

        [[nodiscard]] inline const std::string &uri() const { return _uri; }

        [[nodiscard]] inline HttpMethod method() const { return _method; }

        [[nodiscard]] inline bool keepAlive() const { return _keep_alive; }

        inline void keepAlive(bool keep_alive_p) { _keep_alive = keep_alive_p; }

        /*!
         * Adds the Connection and Keep-Alive headers to the response.
         *
         * \param[in] default_timeout Timeout to use if the client did not ask for one
         * \returns The keep alive timeout, 0 if the connection will be closed
         */
        int setupKeepAlive(int default_timeout = 20);

        [[nodiscard]] inline int keepAliveTimeout() const { return _keep_alive_timeout; }

        /*!
         * Sets the status code of the response. Must be called before the header is sent.
         *
         * \param[in] status_code_p Status code
         * \param[in] status_string_p Reason phrase, the standard phrase if empty
         */
        void status(StatusCodes status_code_p, const std::string &status_string_p = "");

        [[nodiscard]] inline StatusCodes status() const { return status_code; }

        /*!
         * Returns the value of a request header field, an empty string if it is not present
         *
         * \param[in] name Name of the header field (case insensitive)
         */
        std::string header(const std::string &name) const;

        [[nodiscard]] bool hasHeader(const std::string &name) const;

        /*!
         * Adds a header field to the response.
         *
         * \param[in] name Name of the field
         * \param[in] value Value of the field
         */
        void header(const std::string &name, std::string value);

        void corsHeader(const std::string &origin);

        /*!
         * Answers a CORS preflight request (OPTIONS with Origin and Access-Control-Request-Method).
         */
        void sendPreflight();

        /*!
         * Collect all output in a buffer. The buffer is sent by flush() with the proper Content-Length.
         */
        void setBuffer();

        /*!
         * Sends the status line and the header with the given Content-Length. The body has to
         * follow by calls to sendData() and must have exactly content_length bytes.
         *
         * \param[in] content_length Length of the body that will follow
         */
        void sendHeader(size_t content_length);

        /*!
         * Sends body bytes after sendHeader() and flushes them to the socket.
         *
         * \param[in] buffer Data
         * \param[in] n Number of bytes
         *
         * \throws InputFailure(OUTPUT_WRITE_FAIL) if the client connection failed
         */
        void sendData(const void *buffer, size_t n);

        /*!
         * Sends data. In buffered mode the data is appended to the buffer. Otherwise the header
         * is sent with the Content-Length n followed by the data, and the response is complete.
         */
        void send(const void *buffer, size_t n);

        Connection &operator<<(const std::string &str);

        Connection &operator<<(Commands cmd);

        /*!
         * Sends the header (if not yet done) and all buffered data.
         */
        void flush();

        /*!
         * Marks the response as incomplete. Nothing more is written and the server resets the
         * connection instead of closing it orderly.
         */
        inline void abort() {
            _aborted = true;
            _keep_alive = false;
        }

        [[nodiscard]] inline bool aborted() const { return _aborted; }

        [[nodiscard]] inline bool headerSent() const { return header_sent; }

        [[nodiscard]] inline bool resetConnection() const { return _reset_connection; }
    };

}

#endif //BAMRELAY_CONNECTION_H
