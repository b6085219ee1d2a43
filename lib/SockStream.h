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
#ifndef BAMRELAY_SOCKSTREAM_H
#define BAMRELAY_SOCKSTREAM_H

#include <streambuf>

#include "openssl/ssl.h"

namespace bamrelay {

    /*!
     * \brief Implementation of a iostream interface for sockets.
     *
     * SockStream implements the handling for TCP/IP sockets (plain or OpenSSL) as a streambuf. It
     * implements the virtual functions underflow, overflow and sync. Input and output use internal
     * buffers of fixed size.
     *
     * A failed send (peer closed the connection, or the SO_SNDTIMEO of the socket expired) makes
     * overflow() return eof and sync() return -1. The attached ostream therefore goes into the
     * fail state, which Connection reports as InputFailure(OUTPUT_WRITE_FAIL).
     *
     *     SockStream sockstream(sock);
     *     std::istream ins(&sockstream);
     *     std::ostream os(&sockstream);
     */
    class SockStream : public std::streambuf {
    private:
        char *in_buf;      //!< input buffer
        int in_bufsize;    //!< size of input buffer
        int putback_size;  //!< size of the putback area in front of the input buffer. Must be at least 1
        char *out_buf;     //!< output buffer
        int out_bufsize;   //!< Size of output buffer
        int sock;          //!< Socket handle
        SSL *cSSL;         //!< SSL socket handle

        /*!
         * Writes the pending content of the output buffer to the socket.
         *
         * \returns true on success, false if the socket write failed
         */
        bool send_out();

        int_type underflow() override;

        int_type overflow(int_type ch) override;

        int sync() override;

    public:
        /*!
         * Constructor of the streambuf for a plain socket.
         *
         * \param[in] sock_p Socket ID of an open socket for input/output
         * \param[in] in_bufsize_p Size of the input buffer (Default: 8192)
         * \param[in] out_bufsize_p Size of the output buffer (Default: 8192)
         * \param[in] putback_size_p Size of putback buffer
         */
        explicit SockStream(int sock_p, int in_bufsize_p = 8192, int out_bufsize_p = 8192, int putback_size_p = 32);

        /*!
         * Constructor of the streambuf for an OpenSSL connection.
         *
         * \param[in] cSSL_p SSL handle of an accepted connection
         * \param[in] in_bufsize_p Size of the input buffer (Default: 8192)
         * \param[in] out_bufsize_p Size of the output buffer (Default: 8192)
         * \param[in] putback_size_p Size of putback buffer
         */
        explicit SockStream(SSL *cSSL_p, int in_bufsize_p = 8192, int out_bufsize_p = 8192, int putback_size_p = 32);

        SockStream(const SockStream &) = delete;

        SockStream &operator=(const SockStream &) = delete;

        ~SockStream() override;
    };
}

#endif //BAMRELAY_SOCKSTREAM_H
