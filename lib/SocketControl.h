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
#ifndef BAMRELAY_SOCKETCONTROL_H
#define BAMRELAY_SOCKETCONTROL_H

#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include <sys/types.h>
#include <netinet/in.h>
#include <poll.h>

#include "openssl/ssl.h"

#include "ThreadControl.h"

namespace bamrelay {

    /*!
     * \brief Bookkeeping of all sockets the main loop polls
     *
     * The poll array is laid out as
     *
     *     [worker control pipes...][stop socket][http socket][ssl socket][accepted client sockets...]
     *
     * Index i < n_msg_sockets corresponds to worker thread i of the ThreadControl. Client sockets
     * that have input while all workers are busy are parked in the waiting queue.
     */
    class SocketControl {
    public:
        enum ControlMessageType {
            NOOP,
            PROCESS_REQUEST,       //!< master -> worker: process a request on the socket
            FINISHED_AND_CONTINUE, //!< worker -> master: done, keep the socket (keep-alive)
            FINISHED_AND_CLOSE,    //!< worker -> master: done, close the socket orderly
            FINISHED_AND_ABORT,    //!< worker -> master: done, reset the connection (response is incomplete)
            SOCKET_CLOSED,
            EXIT,
            ERROR
        };

        enum SocketType {
            CONTROL_SOCKET, STOP_SOCKET, HTTP_SOCKET, SSL_SOCKET, DYN_SOCKET
        };

        /*!
         * Message exchanged over the control pipes. It is trivially copyable and sent as raw bytes.
         */
        struct SocketInfo {
            ControlMessageType type{NOOP};
            SocketType socket_type{CONTROL_SOCKET};
            int sid{-1};
            SSL *ssl_sid{nullptr};
            SSL_CTX *sslctx{nullptr};
            char peer_ip[INET6_ADDRSTRLEN]{};
            int peer_port{-1};
            time_t last_activity{0}; //!< time the socket was last handed back to the poll loop

            SocketInfo() = default;

            SocketInfo(ControlMessageType type_p, SocketType socket_type_p, int sid_p = -1)
                    : type(type_p), socket_type(socket_type_p), sid(sid_p) {}
        };

    private:
        std::mutex sockets_mutex;
        std::vector<pollfd> open_sockets;            //!< poll array, rebuilt by get_sockets_arr()
        std::vector<SocketInfo> generic_open_sockets; //!< sockets being polled
        std::queue<SocketInfo> waiting_sockets;      //!< client sockets with input waiting for a free worker
        int n_msg_sockets;   //!< Number of sockets communicating with the workers
        int stop_sock_id;    //!< Index of the stop socket
        int http_sock_id;    //!< Index of the HTTP socket
        int ssl_sock_id;     //!< Index of the SSL socket

    public:
        /*!
         * Initialize the socket control with the control pipes of all worker threads.
         *
         * \param[in] thread_control The worker pool
         */
        explicit SocketControl(ThreadControl &thread_control);

        pollfd *get_sockets_arr();

        [[nodiscard]] int get_sockets_size() const { return static_cast<int>(generic_open_sockets.size()); }

        [[nodiscard]] int get_n_msg_sockets() const { return n_msg_sockets; }

        void add_stop_socket(int sid);

        [[nodiscard]] int get_stop_socket_id() const { return stop_sock_id; }

        void add_http_socket(int sid);

        [[nodiscard]] int get_http_socket_id() const { return http_sock_id; }

        void add_ssl_socket(int sid);

        [[nodiscard]] int get_ssl_socket_id() const { return ssl_sock_id; }

        void add_dyn_socket(SocketInfo sockid);

        /*!
         * Index of the first accepted client socket. All sockets before it are control, stop and
         * listening sockets.
         */
        [[nodiscard]] inline int get_dyn_socket_base() const {
            return n_msg_sockets + (stop_sock_id >= 0 ? 1 : 0) + (http_sock_id >= 0 ? 1 : 0) + (ssl_sock_id >= 0 ? 1 : 0);
        }

        SocketInfo remove(int pos);

        void move_to_waiting(int pos);

        std::optional<SocketInfo> get_waiting();

        static ssize_t send_control_message(int pipe_id, const SocketInfo &msg);

        static SocketInfo receive_control_message(int pipe_id);

        /*!
         * Sends EXIT to all workers
         */
        void broadcast_exit();

        /*!
         * Closes all accepted client sockets, including the ones waiting for a worker
         *
         * \param[in] closefunc Function that closes one socket
         */
        void close_all_dynsocks(int (*closefunc)(const SocketInfo &));

        /*!
         * Closes the accepted client sockets that have been idle (no request) for more than
         * timeout seconds.
         *
         * \param[in] now Current time
         * \param[in] timeout Idle timeout in seconds
         * \param[in] closefunc Function that closes one socket
         * \returns Number of sockets closed
         */
        int close_idle_dynsocks(time_t now, int timeout, int (*closefunc)(const SocketInfo &));
    };

}

#endif //BAMRELAY_SOCKETCONTROL_H
