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
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include "SockStream.h"

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL SO_NOSIGPIPE // for OS X
#endif

namespace bamrelay {

    SockStream::SockStream(int sock_p, int in_bufsize_p, int out_bufsize_p, int putback_size_p)
            : in_bufsize(in_bufsize_p), putback_size(putback_size_p), out_bufsize(out_bufsize_p),
              sock(sock_p), cSSL(nullptr) {
        in_buf = new char[in_bufsize + putback_size];
        char *end = in_buf + in_bufsize + putback_size;
        setg(end, end, end);

        out_buf = new char[out_bufsize];
        setp(out_buf, out_buf + out_bufsize);
    }
    //=========================================================================

    SockStream::SockStream(SSL *cSSL_p, int in_bufsize_p, int out_bufsize_p, int putback_size_p)
            : in_bufsize(in_bufsize_p), putback_size(putback_size_p), out_bufsize(out_bufsize_p),
              sock(-1), cSSL(cSSL_p) {
        in_buf = new char[in_bufsize + putback_size];
        char *end = in_buf + in_bufsize + putback_size;
        setg(end, end, end);

        out_buf = new char[out_bufsize];
        setp(out_buf, out_buf + out_bufsize);
    }
    //=========================================================================

    SockStream::~SockStream() {
        delete[] in_buf;
        delete[] out_buf;
    }
    //=========================================================================

    std::streambuf::int_type SockStream::underflow() {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }

        char *start = in_buf;

        if (eback() == in_buf) { // only after the first read: keep the putback area
            std::memmove(in_buf, egptr() - putback_size, putback_size);
            start += putback_size;
        }

        ssize_t n;
        if (cSSL == nullptr) {
            n = ::read(sock, start, in_bufsize);
        } else {
            n = (SSL_get_shutdown(cSSL) == 0) ? SSL_read(cSSL, start, in_bufsize) : 0;
        }
        if (n <= 0) {
            return traits_type::eof();
        }

        setg(in_buf, start, start + n);
        return traits_type::to_int_type(*gptr());
    }
    //=========================================================================

    bool SockStream::send_out() {
        std::ptrdiff_t n = pptr() - out_buf;
        std::ptrdiff_t nn = 0;

        while (nn < n) {
            ssize_t tmp_n;
            if (cSSL == nullptr) {
                tmp_n = ::send(sock, out_buf + nn, n - nn, MSG_NOSIGNAL);
            } else {
                tmp_n = (SSL_get_shutdown(cSSL) == 0) ? SSL_write(cSSL, out_buf + nn, static_cast<int>(n - nn)) : 0;
            }
            if (tmp_n <= 0) {
                return false; // broken pipe, peer reset or send timeout
            }
            nn += tmp_n;
        }
        setp(out_buf, out_buf + out_bufsize);
        return true;
    }
    //=========================================================================

    std::streambuf::int_type SockStream::overflow(std::streambuf::int_type ch) {
        if (!send_out()) {
            return traits_type::eof();
        }
        if (ch != traits_type::eof()) {
            *pptr() = static_cast<char>(ch);
            pbump(1);
        }
        return traits_type::not_eof(ch);
    }
    //=========================================================================

    int SockStream::sync() {
        return send_out() ? 0 : -1;
    }
    //=========================================================================

}
