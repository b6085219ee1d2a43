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
#include <type_traits>

#include <sys/socket.h>
#include <unistd.h>

#include "Error.h"
#include "Bamrelay.h"
#include "SocketControl.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    static_assert(std::is_trivially_copyable<SocketControl::SocketInfo>::value,
                  "SocketInfo is sent as raw bytes over the control pipes");

    SocketControl::SocketControl(ThreadControl &thread_control) {
        for (int i = 0; i < thread_control.nthreads(); i++) {
            generic_open_sockets.emplace_back(NOOP, CONTROL_SOCKET, thread_control[i].control_pipe);
        }
        n_msg_sockets = thread_control.nthreads();
        stop_sock_id = -1;
        http_sock_id = -1;
        ssl_sock_id = -1;
    }
    //=========================================================================

    pollfd *SocketControl::get_sockets_arr() {
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        open_sockets.clear();
        for (auto const &tmp: generic_open_sockets) {
            open_sockets.push_back({tmp.sid, POLLIN, 0});
        }
        return open_sockets.data();
    }
    //=========================================================================

    void SocketControl::add_stop_socket(int sid) { // only called once
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if (static_cast<int>(generic_open_sockets.size()) != get_dyn_socket_base()) {
            throw Error(file_, __LINE__, "Adding stop socket not allowed after adding client sockets!");
        }
        generic_open_sockets.emplace_back(NOOP, STOP_SOCKET, sid);
        stop_sock_id = static_cast<int>(generic_open_sockets.size() - 1);
    }
    //=========================================================================

    void SocketControl::add_http_socket(int sid) { // only called once
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if (static_cast<int>(generic_open_sockets.size()) != get_dyn_socket_base()) {
            throw Error(file_, __LINE__, "Adding HTTP socket not allowed after adding client sockets!");
        }
        generic_open_sockets.emplace_back(NOOP, HTTP_SOCKET, sid);
        http_sock_id = static_cast<int>(generic_open_sockets.size() - 1);
    }
    //=========================================================================

    void SocketControl::add_ssl_socket(int sid) { // only called once
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if (static_cast<int>(generic_open_sockets.size()) != get_dyn_socket_base()) {
            throw Error(file_, __LINE__, "Adding SSL socket not allowed after adding client sockets!");
        }
        generic_open_sockets.emplace_back(NOOP, SSL_SOCKET, sid);
        ssl_sock_id = static_cast<int>(generic_open_sockets.size() - 1);
    }
    //=========================================================================

    void SocketControl::add_dyn_socket(SocketInfo sockid) { // changes the poll array!
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        sockid.type = NOOP;
        sockid.socket_type = DYN_SOCKET;
        sockid.last_activity = time(nullptr);
        generic_open_sockets.push_back(sockid);
    }
    //=========================================================================

    SocketControl::SocketInfo SocketControl::remove(int pos) { // changes the poll array!
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if ((pos < 0) || (pos >= static_cast<int>(generic_open_sockets.size()))) {
            throw Error(file_, __LINE__, "Socket index out of range!");
        }
        SocketInfo sockid = generic_open_sockets[pos];
        generic_open_sockets.erase(generic_open_sockets.begin() + pos);

        auto shift = [pos](int &idx) {
            if (idx == pos) idx = -1;
            else if (idx > pos) idx--;
        };
        if (pos < n_msg_sockets) n_msg_sockets--;
        shift(stop_sock_id);
        shift(http_sock_id);
        shift(ssl_sock_id);
        return sockid;
    }
    //=========================================================================

    void SocketControl::move_to_waiting(int pos) { // changes the poll array!
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if ((pos < get_dyn_socket_base()) || (pos >= static_cast<int>(generic_open_sockets.size()))) {
            throw Error(file_, __LINE__, "Socket index out of range!");
        }
        waiting_sockets.push(generic_open_sockets[pos]);
        generic_open_sockets.erase(generic_open_sockets.begin() + pos);
    }
    //=========================================================================

    std::optional<SocketControl::SocketInfo> SocketControl::get_waiting() {
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        if (waiting_sockets.empty()) {
            return {};
        }
        SocketInfo sock_info = waiting_sockets.front();
        waiting_sockets.pop();
        return sock_info;
    }
    //=========================================================================

    ssize_t SocketControl::send_control_message(int pipe_id, const SocketInfo &msg) {
        return ::send(pipe_id, &msg, sizeof(SocketInfo), MSG_NOSIGNAL);
    }
    //=========================================================================

    SocketControl::SocketInfo SocketControl::receive_control_message(int pipe_id) {
        SocketInfo msg;
        ssize_t n = ::read(pipe_id, &msg, sizeof(SocketInfo));
        if (n == 0) {
            msg = SocketInfo(SOCKET_CLOSED, CONTROL_SOCKET, pipe_id);
        } else if (n != static_cast<ssize_t>(sizeof(SocketInfo))) {
            Server::logger()->error("Control message truncated: received {} of {} bytes", n, sizeof(SocketInfo));
            msg = SocketInfo(ERROR, CONTROL_SOCKET, pipe_id);
        }
        return msg;
    }
    //=========================================================================

    void SocketControl::broadcast_exit() {
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        for (int i = 0; i < n_msg_sockets; i++) {
            SocketInfo msg(EXIT, CONTROL_SOCKET, generic_open_sockets[i].sid);
            if (send_control_message(generic_open_sockets[i].sid, msg) < 0) {
                Server::logger()->warn("Could not send EXIT to worker {}", i);
            }
        }
    }
    //=========================================================================

    void SocketControl::close_all_dynsocks(int (*closefunc)(const SocketInfo &)) {
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        int base = get_dyn_socket_base();
        for (int i = base; i < static_cast<int>(generic_open_sockets.size()); i++) {
            (void) closefunc(generic_open_sockets[i]);
        }
        generic_open_sockets.erase(generic_open_sockets.begin() + base, generic_open_sockets.end());
        while (!waiting_sockets.empty()) {
            (void) closefunc(waiting_sockets.front());
            waiting_sockets.pop();
        }
    }
    //=========================================================================

    int SocketControl::close_idle_dynsocks(time_t now, int timeout, int (*closefunc)(const SocketInfo &)) {
        std::unique_lock<std::mutex> mutex_guard(sockets_mutex);
        int n = 0;
        auto it = generic_open_sockets.begin() + get_dyn_socket_base();
        while (it != generic_open_sockets.end()) {
            if ((now - it->last_activity) > timeout) {
                (void) closefunc(*it);
                it = generic_open_sockets.erase(it);
                n++;
            } else {
                ++it;
            }
        }
        return n;
    }
    //=========================================================================

}
