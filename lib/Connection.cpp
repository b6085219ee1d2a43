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
#include <cctype>
#include <sstream>

#include "Global.h"
#include "Connection.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    const size_t max_headerline_len = 65535;

    std::unordered_map<std::string, std::string> parse_header_options(const std::string &options, char sep) {
        std::unordered_map<std::string, std::string> q;
        for (auto &param: split(options, sep)) {
            std::string name;
            std::string value;
            size_t pos;
            if ((pos = param.find('=')) != std::string::npos) {
                name = param.substr(0, pos);
                value = param.substr(pos + 1);
            } else {
                name = param;
            }
            name = trim_copy(name);
            if (name.empty()) continue;
            asciitolower(name);
            q[name] = trim_copy(value);
        }
        return q;
    }
    //=========================================================================

    size_t safeGetline(std::istream &is, std::string &t, size_t max_n) {
        t.clear();

        size_t n = 0;
        for (;;) {
            int c = is.get();
            switch (c) {
                case '\n':
                    n++;
                    return n;
                case '\r':
                    n++;
                    if (is.peek() == '\n') {
                        is.get();
                        n++;
                    }
                    return n;
                case EOF:
                    return n;
                default:
                    n++;
                    t += (char) c;
            }
            if ((max_n > 0) && (n >= max_n)) {
                throw Error(file_, __LINE__, "Input line too long!");
            }
        }
    }
    //=========================================================================

    std::string urldecode(const std::string &src) {

#define HEXTOI(x) (isdigit(x) ? (x) - '0' : (x) - 'W')

        std::string out;
        out.reserve(src.length());
        size_t start = 0;
        size_t pos;

        while ((pos = src.find('%', start)) != std::string::npos) {
            out += src.substr(start, pos - start);
            if (((pos + 2) < src.length()) && isxdigit(src[pos + 1]) && isxdigit(src[pos + 2])) {
                char a = (char) tolower(src[pos + 1]);
                char b = (char) tolower(src[pos + 2]);
                out += (char) ((HEXTOI(a) << 4) | HEXTOI(b));
                start = pos + 3;
            } else {
                out += '%'; // not an escape, keep it as it is
                start = pos + 1;
            }
        }
        out += src.substr(start);
        return out;

#undef HEXTOI
    }
    //=========================================================================

    std::string Connection::method_as_string(HttpMethod method) {
        switch (method) {
            case OPTIONS: return "OPTIONS";
            case GET: return "GET";
            case HEAD: return "HEAD";
            case POST: return "POST";
            case PUT: return "PUT";
            case DELETE: return "DELETE";
            case TRACE: return "TRACE";
            case CONNECT: return "CONNECT";
            case OTHER: return "OTHER";
        }
        return "OTHER";
    }
    //=========================================================================

    void Connection::process_header() {
        bool eoh = false; //end of header reached
        std::string line;

        while (!eoh && !ins->eof() && !ins->fail()) {
            (void) safeGetline(*ins, line, max_headerline_len);

            if (line.empty() || ins->fail()) {
                eoh = true;
            } else {
                size_t pos = line.find(':');
                if (pos == std::string::npos) {
                    throw Error(file_, __LINE__, "Invalid header line: " + line);
                }
                std::string name = trim_copy(line.substr(0, pos));
                asciitolower(name);
                std::string value = header_in[name] = trim_copy(line.substr(pos + 1));

                if (name == "connection") {
                    std::unordered_map<std::string, std::string> opts = parse_header_options(value, ',');
                    if (opts.count("close") == 1) {
                        _keep_alive = false;
                    } else if (opts.count("keep-alive") == 1) {
                        _keep_alive = true;
                    }
                } else if (name == "keep-alive") {
                    std::unordered_map<std::string, std::string> opts = parse_header_options(value, ',');
                    if (opts.count("timeout") == 1) {
                        try {
                            _keep_alive_timeout = std::stoi(opts["timeout"]);
                        } catch (const std::logic_error &) {
                            _keep_alive_timeout = -1;
                        }
                    }
                }
            }
        }
    }
    //=============================================================================

    Connection::Connection(std::istream *ins_p, std::ostream *os_p)
            : ins(ins_p), os(os_p) {
        _peer_port = -1;
        _secure = false;
        _method = OTHER;
        status(OK);
        header_sent = false;
        _keep_alive = false;
        _keep_alive_timeout = -1;
        _finished = false;
        _aborted = false;
        _buffered = false;
        _reset_connection = false;

        std::string line;
        if ((safeGetline(*ins, line, max_headerline_len) == 0) || line.empty() || ins->fail() || ins->eof()) {
            //
            // we got either a timeout or a socket close (for shutdown of server)
            //
            throw InputFailure(INPUT_READ_FAIL);
        }
        //
        // Parse first line of request
        //
        std::string method_in;
        std::string fulluri;
        std::stringstream lineparse(line);
        lineparse >> method_in >> fulluri >> http_version;
        if (lineparse.fail()) {
            throw Error(file_, __LINE__, "Invalid HTTP request line: " + line);
        }

        size_t pos;
        if ((pos = fulluri.find('?')) != std::string::npos) {
            _uri = fulluri.substr(0, pos);
        } else {
            _uri = fulluri;
        }

        //
        // HTTP/1.1 keeps the connection open unless the client says otherwise
        //
        _keep_alive = (http_version == "HTTP/1.1");

        process_header();

        if (ins->fail()) {
            throw InputFailure(INPUT_READ_FAIL);
        }

        if (method_in == "OPTIONS") {
            _method = OPTIONS;
        } else if (method_in == "GET") {
            _method = GET;
        } else if (method_in == "HEAD") {
            _method = HEAD;
        } else if (method_in == "POST") {
            _method = POST;
        } else if (method_in == "PUT") {
            _method = PUT;
        } else if (method_in == "DELETE") {
            _method = DELETE;
        } else if (method_in == "TRACE") {
            _method = TRACE;
        } else if (method_in == "CONNECT") {
            _method = CONNECT;
        } else {
            _method = OTHER;
        }

        //
        // check if we have a CORS request and add the appropriate headers
        //
        auto origin = header_in.find("origin");
        if (origin != header_in.end()) {
            corsHeader(origin->second);
            if ((_method == OPTIONS) && (header_in.count("access-control-request-method") == 1)) {
                _reset_connection = true; // answered by sendPreflight()
            }
        }
    }
    //=============================================================================

    Connection::~Connection() {
        try {
            finalize();
        } catch (InputFailure &iofail) {
            // the client went away, nothing left to do
        } catch (const Error &err) {
            // cannot throw from a destructor
        }
    }
    //=============================================================================

    int Connection::setupKeepAlive(int default_timeout) {
        if (_keep_alive) {
            header_out["Connection"] = "keep-alive";

            if (_keep_alive_timeout <= 0) {
                _keep_alive_timeout = default_timeout;
            }

            if (_keep_alive_timeout > 0) {
                header_out["Keep-Alive"] = std::string("timeout=") + std::to_string(_keep_alive_timeout);
            }
        } else {
            header_out["Connection"] = "close";
            _keep_alive_timeout = 0;
        }
        return _keep_alive_timeout;
    }
    //=============================================================================

    void Connection::status(StatusCodes status_code_p, const std::string &status_string_p) {
        status_code = status_code_p;
        if (!status_string_p.empty()) {
            status_string = status_string_p;
            return;
        }
        switch (status_code_p) {
            case OK: status_string = "OK"; break;
            case NO_CONTENT: status_string = "No Content"; break;
            case PARTIAL_CONTENT: status_string = "Partial Content"; break;
            case BAD_REQUEST: status_string = "Bad Request"; break;
            case UNAUTHORIZED: status_string = "Unauthorized"; break;
            case FORBIDDEN: status_string = "Forbidden"; break;
            case NOT_FOUND: status_string = "Not Found"; break;
            case METHOD_NOT_ALLOWED: status_string = "Method Not Allowed"; break;
            case REQUEST_TIMEOUT: status_string = "Request Timeout"; break;
            case REQUEST_RANGE_NOT_SATISFIABLE: status_string = "Range Not Satisfiable"; break;
            case INTERNAL_SERVER_ERROR: status_string = "Internal Server Error"; break;
            case NOT_IMPLEMENTED: status_string = "Not Implemented"; break;
            case BAD_GATEWAY: status_string = "Bad Gateway"; break;
            case SERVICE_UNAVAILABLE: status_string = "Service Unavailable"; break;
            case GATEWAY_TIMEOUT: status_string = "Gateway Timeout"; break;
        }
    }
    //=============================================================================

    std::string Connection::header(const std::string &name) const {
        std::string lname{name};
        asciitolower(lname);
        auto it = header_in.find(lname);
        return (it == header_in.end()) ? std::string() : it->second;
    }
    //=============================================================================

    bool Connection::hasHeader(const std::string &name) const {
        std::string lname{name};
        asciitolower(lname);
        return header_in.count(lname) == 1;
    }
    //=============================================================================

    void Connection::header(const std::string &name, std::string value) {
        if (header_sent) {
            throw Error(file_, __LINE__, "Header already sent!");
        }
        header_out[name] = std::move(value);
    }
    //=============================================================================

    void Connection::corsHeader(const std::string &origin) {
        header_out["Access-Control-Allow-Origin"] = origin;
        header_out["Access-Control-Allow-Credentials"] = "true";
        header_out["Access-Control-Expose-Headers"] = "Content-Range, Content-Length, Accept-Ranges";
    }
    //=============================================================================

    void Connection::sendPreflight() {
        std::string xreq = header("access-control-request-headers");
        header_out["Access-Control-Allow-Methods"] = "GET, HEAD, OPTIONS";
        header_out["Access-Control-Allow-Headers"] = xreq.empty() ? std::string("Range") : xreq;
        header_out["Access-Control-Max-Age"] = "86400";
        status(NO_CONTENT);
        send_header(0);
        _finished = true;
    }
    //=============================================================================

    void Connection::setBuffer() {
        if (header_sent) {
            throw Error(file_, __LINE__, "Header already sent!");
        }
        _buffered = true;
    }
    //=============================================================================

    void Connection::check_output() {
        if (os->eof() || os->fail()) {
            throw InputFailure(OUTPUT_WRITE_FAIL);
        }
    }
    //=============================================================================

    void Connection::send_header(size_t n) {
        if (header_sent) {
            throw Error(file_, __LINE__, "Header already sent!");
        }
        header_out.erase("Content-Length");

        *os << "HTTP/1.1 " << std::to_string(status_code) << " " << status_string << "\r\n";
        for (auto const &item: header_out) {
            *os << item.first << ": " << item.second << "\r\n";
        }
        *os << "Content-Length: " << n << "\r\n";
        *os << "\r\n";
        header_sent = true;
        check_output();
        os->flush();
        check_output();
    }
    //=============================================================================

    void Connection::sendHeader(size_t content_length) {
        if (_buffered) {
            throw Error(file_, __LINE__, "sendHeader() cannot be used in buffered mode!");
        }
        send_header(content_length);
        if ((content_length == 0) || (_method == HEAD)) {
            _finished = true;
        }
    }
    //=============================================================================

    void Connection::sendData(const void *buffer, size_t n) {
        if (!header_sent) {
            throw Error(file_, __LINE__, "sendData() called before sendHeader()!");
        }
        if (_aborted || (_method == HEAD) || (n == 0)) return;
        os->write(static_cast<const char *>(buffer), static_cast<std::streamsize>(n));
        check_output();
        os->flush();
        check_output();
    }
    //=============================================================================

    void Connection::send(const void *buffer, size_t n) {
        if (_finished) {
            throw Error(file_, __LINE__, "Sending data already terminated!");
        }
        if (_buffered) {
            outbuf.append(static_cast<const char *>(buffer), n);
            return;
        }
        send_header(n);
        if (_method != HEAD) {
            os->write(static_cast<const char *>(buffer), static_cast<std::streamsize>(n));
            check_output();
            os->flush();
            check_output();
        }
        _finished = true;
    }
    //=============================================================================

    Connection &Connection::operator<<(const std::string &str) {
        send(str.data(), str.length());
        return *this;
    }
    //=============================================================================

    Connection &Connection::operator<<(Commands cmd) {
        if (cmd == flush_data) {
            flush();
        }
        return *this;
    }
    //=============================================================================

    void Connection::flush() {
        if (_aborted || _finished) return;
        if (_buffered) {
            _buffered = false;
            std::string data;
            data.swap(outbuf);
            if (header_sent) {
                throw Error(file_, __LINE__, "Header already sent!");
            } else {
                send(data.data(), data.size());
            }
            return;
        }
        if (!header_sent) {
            send_header(0);
            _finished = true;
            return;
        }
        os->flush();
        check_output();
    }
    //=============================================================================

    void Connection::finalize() {
        if (_aborted || _finished) return;
        flush();
        _finished = true;
    }
    //=============================================================================

}
