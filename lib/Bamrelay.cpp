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
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>
#include <utility>

#include <sys/socket.h>
#include <sys/time.h>
#include <poll.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <pthread.h>
#include <pwd.h>

#include "fmt/format.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#include "SockStream.h"
#include "Bamrelay.h"
#include "DefaultHandler.h"
#include "HttpSendError.h"

#include "BamrelayVersion.h"

static const char file_[] = __FILE__;

std::string bamrelay::Server::_loggername;
std::shared_ptr<spdlog::logger> bamrelay::Server::_logger = nullptr;

namespace bamrelay {

    /*!
     * Runs in a thread just to catch all signals sent to the server process.
     * If it receives SIGINT or SIGTERM, tells the server to stop.
     */
    static void sig_thread(Server *serverptr) {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);

        int sig;
        while (true) {
            if ((sigwait(&set, &sig)) != 0) {
                return;
            }
            // If we get SIGINT or SIGTERM, shut down the server.
            // Ignore any other signals. We must in particular ignore SIGPIPE.
            if (sig == SIGINT || sig == SIGTERM) {
                serverptr->stop();
                return;
            }
        }
    }
    //=========================================================================

    Server::Server(int port, unsigned nthreads, const std::string &userid_str)
            : _port(port), _ssl_port(-1), _sockfd(-1), _ssl_sockfd(-1), _nthreads(nthreads),
              _keep_alive_timeout(5), _io_timeout(30), running(false) {
        stoppipe[0] = -1;
        stoppipe[1] = -1;

        //
        // Here we check if we have to change to a different uid. This can only be done
        // if the server runs originally as root!
        //
        if (!userid_str.empty()) {
            if (getuid() == 0) { // must be root to setuid() !!
                struct passwd pwd{}, *res = nullptr;
                size_t buffer_len = sysconf(_SC_GETPW_R_SIZE_MAX) * sizeof(char);
                auto buffer = std::make_unique<char[]>(buffer_len);
                getpwnam_r(userid_str.c_str(), &pwd, buffer.get(), buffer_len, &res);

                if (res != nullptr) {
                    if (setgid(pwd.pw_gid) == 0) {
                        Server::logger()->info("Server will run with group-id {}", getgid());
                    } else {
                        Server::logger()->error("setgid() failed: {}", strerror(errno));
                    }
                    if (setuid(pwd.pw_uid) == 0) {
                        Server::logger()->info("Server will run as user {} ({}).", userid_str, getuid());
                    } else {
                        Server::logger()->error("setuid() failed: {}", strerror(errno));
                    }
                } else {
                    Server::logger()->error("Could not get uid of user {}", userid_str);
                }
            } else {
                Server::logger()->error("Could not change to user {}: you must start bamrelay as root.", userid_str);
            }
        }
        SSL_load_error_strings();
        SSL_library_init();
        OpenSSL_add_all_algorithms();

        default_handler = std::make_shared<DefaultHandler>();
    }
    //=========================================================================

    std::string Server::version_string() {
        return fmt::format("*** BAMRELAY V{}.{}.{} ***", bamrelay_VERSION_MAJOR, bamrelay_VERSION_MINOR,
                           bamrelay_VERSION_PATCH);
    }
    //=========================================================================

    static bool route_matches(const std::string &route, const std::string &uri) {
        if (uri.compare(0, route.length(), route) != 0) return false;
        if (uri.length() == route.length()) return true;
        return (route.back() == '/') || (uri[route.length()] == '/');
    }
    //=========================================================================

    std::tuple<std::shared_ptr<RequestHandler>, std::string> Server::getHandler(Connection &conn) {
        size_t max_match_len = 0;
        std::string matching_path;
        std::shared_ptr<RequestHandler> matching_handler;

        for (auto const &[route, hfunc]: handler[conn.method()]) {
            if (route_matches(route, conn.uri()) && (route.length() > max_match_len)) {
                max_match_len = route.length();
                matching_path = route;
                matching_handler = hfunc;
            }
        }
        return {matching_handler, matching_path};
    }
    //=============================================================================

    std::vector<Connection::HttpMethod> Server::allowedMethods(const std::string &uri) {
        std::vector<Connection::HttpMethod> methods;
        for (int m = 0; m < Connection::NumHttpMethods; m++) {
            for (auto const &item: handler[m]) {
                if (route_matches(item.first, uri)) {
                    methods.push_back(static_cast<Connection::HttpMethod>(m));
                    break;
                }
            }
        }
        return methods;
    }
    //=============================================================================

    /*!
     * Setup the server socket with the correct parameters
     *
     * @param port Port number
     * @return Socket ID
     * @throws Error if the socket cannot be opened
     */
    static int prepare_socket(int port) {
        int sockfd;
        struct sockaddr_in serv_addr{};

        if ((sockfd = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
            throw Error(file_, __LINE__, "Could not create socket", errno);
        }

        int optval = 1;
        if (::setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval) < 0) {
            ::close(sockfd);
            throw Error(file_, __LINE__, "Could not set socket option", errno);
        }

        serv_addr.sin_family = AF_INET;
        serv_addr.sin_addr.s_addr = INADDR_ANY;
        serv_addr.sin_port = htons(port);

        if (::bind(sockfd, (struct sockaddr *) &serv_addr, sizeof(serv_addr)) < 0) {
            ::close(sockfd);
            throw Error(file_, __LINE__, fmt::format("Could not bind socket to port {}", port), errno);
        }

        if (::listen(sockfd, SOMAXCONN) < 0) {
            ::close(sockfd);
            throw Error(file_, __LINE__, "Could not listen on socket", errno);
        }
        return sockfd;
    }
    //=========================================================================

    std::shared_ptr<spdlog::logger> Server::create_logger(spdlog::level::level_enum level, bool consolelog,
                                                          const std::string &logfile) {
        if (Server::_loggername.empty()) Server::_loggername = "bamrelay_logger";
        std::vector<spdlog::sink_ptr> sinks;
        if (consolelog) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (!logfile.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile));
        }
        spdlog::drop(Server::_loggername);
        Server::_logger = std::make_shared<spdlog::logger>(Server::_loggername, sinks.begin(), sinks.end());
        Server::_logger->set_level(level);
        spdlog::register_logger(Server::_logger);
        return Server::_logger;
    }
    //=========================================================================

    std::shared_ptr<spdlog::logger> Server::logger(spdlog::level::level_enum level) {
        if (Server::_logger == nullptr) {
            Server::_logger = Server::create_logger(level);
        }
        return Server::_logger;
    }
    //=========================================================================

    /*!
     * Close a socket orderly
     */
    static int close_socket(const SocketControl::SocketInfo &sockid) {
        if (sockid.ssl_sid != nullptr) {
            int sstat = SSL_shutdown(sockid.ssl_sid);
            if (sstat < 0) {
                Server::logger()->debug("SSL socket error: shutdown of socket failed with error code {}",
                                        SSL_get_error(sockid.ssl_sid, sstat));
            }
            SSL_free(sockid.ssl_sid);
            SSL_CTX_free(sockid.sslctx);
        }
        if (shutdown(sockid.sid, SHUT_RDWR) < 0) {
            Server::logger()->debug("Shutting down socket at [{}: {}] failed: {} (client terminated already?)",
                                    file_, __LINE__, strerror(errno));
        }
        if (close(sockid.sid) == -1) {
            Server::logger()->debug("Closing socket at [{}: {}] failed: {} (client terminated already?)",
                                    file_, __LINE__, strerror(errno));
        }
        return 0;
    }
    //=========================================================================

    /*!
     * Reset a connection. The client sees a connection reset instead of an orderly end of
     * the response, so an incomplete body cannot be taken for a complete one.
     */
    static int abort_socket(const SocketControl::SocketInfo &sockid) {
        if (sockid.ssl_sid != nullptr) {
            SSL_free(sockid.ssl_sid); // no close_notify
            SSL_CTX_free(sockid.sslctx);
        }
        struct linger lin{1, 0};
        if (::setsockopt(sockid.sid, SOL_SOCKET, SO_LINGER, &lin, sizeof(lin)) < 0) {
            Server::logger()->debug("Setting SO_LINGER failed: {}", strerror(errno));
        }
        if (close(sockid.sid) == -1) {
            Server::logger()->debug("Closing socket at [{}: {}] failed: {}", file_, __LINE__, strerror(errno));
        }
        return 0;
    }
    //=========================================================================

    static void process_request(ThreadControl::ThreadChildData &tdata) {
        pollfd readfds[1];
        readfds[0] = {tdata.control_pipe, POLLIN, 0};

        do {
            int poll_status = poll(readfds, 1, -1);
            if (poll_status < 0) {
                if (errno == EINTR) continue;
                Server::logger()->error("Blocking poll on control pipe failed at [{}: {}]", file_, __LINE__);
                tdata.result = -1;
                return;
            }
            if (readfds[0].revents & POLLIN) {
                SocketControl::SocketInfo msg = SocketControl::receive_control_message(tdata.control_pipe);
                switch (msg.type) {
                    case SocketControl::PROCESS_REQUEST: {
                        std::unique_ptr<SockStream> sockstream;
                        if (msg.ssl_sid != nullptr) {
                            sockstream = std::make_unique<SockStream>(msg.ssl_sid);
                        } else {
                            sockstream = std::make_unique<SockStream>(msg.sid);
                        }
                        std::istream ins(sockstream.get());
                        std::ostream os(sockstream.get());

                        int keep_alive = 1;
                        std::string peer_ip(msg.peer_ip);
                        ThreadStatus tstatus = tdata.serv->processRequest(&ins, &os, peer_ip, msg.peer_port,
                                                                          msg.ssl_sid != nullptr, keep_alive);
                        //
                        // send the finished message
                        //
                        switch (tstatus) {
                            case CONTINUE: msg.type = SocketControl::FINISHED_AND_CONTINUE; break;
                            case CLOSE: msg.type = SocketControl::FINISHED_AND_CLOSE; break;
                            case ABORT: msg.type = SocketControl::FINISHED_AND_ABORT; break;
                        }
                        if (SocketControl::send_control_message(tdata.control_pipe, msg) < 0) {
                            Server::logger()->error("Worker could not send FINISHED message: {}", strerror(errno));
                        }
                        break;
                    }
                    case SocketControl::EXIT:
                    case SocketControl::SOCKET_CLOSED: {
                        tdata.result = 0;
                        return;
                    }
                    case SocketControl::ERROR: {
                        tdata.result = -1;
                        return;
                    }
                    default:
                        break;
                }
            } else if (readfds[0].revents & POLLHUP) {
                return;
            } else if (readfds[0].revents & (POLLERR | POLLNVAL)) {
                Server::logger()->error("Worker thread got POLLERR on control pipe");
                return;
            }
        } while (true);
    }
    //=========================================================================

    SocketControl::SocketInfo Server::accept_connection(int sock, bool ssl) {
        SocketControl::SocketInfo socket_id(SocketControl::NOOP, SocketControl::DYN_SOCKET);

        struct sockaddr_storage cli_addr{};
        socklen_t cli_size = sizeof(cli_addr);
        socket_id.sid = accept(sock, (struct sockaddr *) &cli_addr, &cli_size);
        if (socket_id.sid < 0) {
            throw Error(file_, __LINE__, "accept() failed", errno);
        }

        //
        // get peer address
        //
        if (cli_addr.ss_family == AF_INET) {
            auto *s = (struct sockaddr_in *) &cli_addr;
            socket_id.peer_port = ntohs(s->sin_port);
            inet_ntop(AF_INET, &s->sin_addr, socket_id.peer_ip, sizeof(socket_id.peer_ip));
        } else if (cli_addr.ss_family == AF_INET6) {
            auto *s = (struct sockaddr_in6 *) &cli_addr;
            socket_id.peer_port = ntohs(s->sin6_port);
            inet_ntop(AF_INET6, &s->sin6_addr, socket_id.peer_ip, sizeof(socket_id.peer_ip));
        } else {
            socket_id.peer_port = -1;
        }

        //
        // a client that stops reading (or sending) must not block a worker forever
        //
        struct timeval tv{};
        tv.tv_sec = _io_timeout;
        tv.tv_usec = 0;
        if (::setsockopt(socket_id.sid, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            Server::logger()->warn("Could not set SO_SNDTIMEO: {}", strerror(errno));
        }
        if (::setsockopt(socket_id.sid, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            Server::logger()->warn("Could not set SO_RCVTIMEO: {}", strerror(errno));
        }

        if (ssl) {
            SSL *cSSL = nullptr;
            SSL_CTX *sslCtx = nullptr;
            try {
                if ((sslCtx = SSL_CTX_new(SSLv23_server_method())) == nullptr) {
                    throw SSLError(file_, __LINE__, "OpenSSL error: SSL_CTX_new() failed");
                }
                SSL_CTX_set_options(sslCtx, SSL_OP_SINGLE_DH_USE);
                if (SSL_CTX_use_certificate_file(sslCtx, _ssl_certificate.c_str(), SSL_FILETYPE_PEM) != 1) {
                    throw SSLError(file_, __LINE__,
                                   fmt::format("OpenSSL error: SSL_CTX_use_certificate_file({}) failed.", _ssl_certificate));
                }
                if (SSL_CTX_use_PrivateKey_file(sslCtx, _ssl_key.c_str(), SSL_FILETYPE_PEM) != 1) {
                    throw SSLError(file_, __LINE__,
                                   fmt::format("OpenSSL error: SSL_CTX_use_PrivateKey_file({}) failed", _ssl_key));
                }
                if (!SSL_CTX_check_private_key(sslCtx)) {
                    throw SSLError(file_, __LINE__, "OpenSSL error: SSL_CTX_check_private_key() failed");
                }
                if ((cSSL = SSL_new(sslCtx)) == nullptr) {
                    throw SSLError(file_, __LINE__, "OpenSSL error: SSL_new() failed");
                }
                if (SSL_set_fd(cSSL, socket_id.sid) != 1) {
                    throw SSLError(file_, __LINE__, "OpenSSL error: SSL_set_fd() failed");
                }
                if ((SSL_accept(cSSL)) <= 0) {
                    throw SSLError(file_, __LINE__, "OpenSSL error: SSL_accept() failed");
                }
            } catch (const SSLError &err) {
                Server::logger()->error(err.to_string());
                if (cSSL != nullptr) SSL_free(cSSL);
                if (sslCtx != nullptr) SSL_CTX_free(sslCtx);
                ::close(socket_id.sid);
                throw Error(file_, __LINE__, "SSL handshake failed");
            }
            socket_id.ssl_sid = cSSL;
            socket_id.sslctx = sslCtx;
        }
        return socket_id;
    }
    //=========================================================================

    /*!
     * A worker finished a request. If client sockets are waiting, the worker gets the next one,
     * otherwise it is put back into the queue of idle workers.
     */
    static void dispatch_waiting(SocketControl &socket_control, ThreadControl &thread_control, int i, int pipe) {
        std::optional<SocketControl::SocketInfo> opt_sockid = socket_control.get_waiting();
        if (opt_sockid.has_value()) {
            SocketControl::SocketInfo sockid = opt_sockid.value();
            sockid.type = SocketControl::PROCESS_REQUEST;
            if (SocketControl::send_control_message(pipe, sockid) < 0) {
                Server::logger()->error("Could not dispatch waiting socket to worker: {}", strerror(errno));
                close_socket(sockid);
            }
        } else {
            thread_control.thread_push(thread_control[i]);
        }
    }
    //=========================================================================

    void Server::run() {
        //
        // Block the signals in all threads. They are caught by the signal thread
        //
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGPIPE);
        int pthread_sigmask_result = pthread_sigmask(SIG_BLOCK, &set, nullptr);
        if (pthread_sigmask_result != 0) {
            Server::logger()->error("pthread_sigmask failed! (err={})", pthread_sigmask_result);
        }

        if (socketpair(PF_LOCAL, SOCK_STREAM, 0, stoppipe) != 0) {
            throw Error(file_, __LINE__, "Creating stop pipe failed", errno);
        }

        _sockfd = prepare_socket(_port);
        Server::logger()->info("Server listening on HTTP port {}", _port);
        if (_ssl_port > 0) {
            _ssl_sockfd = prepare_socket(_ssl_port);
            Server::logger()->info("Server listening on SSL port {}", _ssl_port);
        }

        std::thread sighandler_thread(sig_thread, this);

        Server::logger()->info("Starting bamrelay server with {} threads", _nthreads);
        {
            ThreadControl thread_control(_nthreads, process_request, this);
            SocketControl socket_control(thread_control);

            socket_control.add_stop_socket(stoppipe[0]);
            socket_control.add_http_socket(_sockfd);
            if (_ssl_port > 0) {
                socket_control.add_ssl_socket(_ssl_sockfd);
            }

            running = true;
            Server::logger()->info("bamrelay ready");
            while (running) {
                //
                // poll on all input sockets. The timeout is used to close idle keep-alive connections
                //
                pollfd *sockets = socket_control.get_sockets_arr();
                int nsockets = socket_control.get_sockets_size();
                int poll_status = poll(sockets, nsockets, 1000);
                if (poll_status < 0) {
                    if (errno == EINTR) continue;
                    Server::logger()->error("Blocking poll failed at [{}: {}]: {}", file_, __LINE__, strerror(errno));
                    running = false;
                    break;
                }
                if (poll_status == 0) {
                    int n = socket_control.close_idle_dynsocks(time(nullptr), _keep_alive_timeout, close_socket);
                    if (n > 0) Server::logger()->debug("Closed {} idle connections", n);
                    continue;
                }

                //
                // Every event that changes the socket list ends the scan, the poll is then redone
                // with the new list. Pending events are reported again by the next poll.
                //
                for (int i = 0; i < nsockets; i++) {
                    if (sockets[i].revents == 0) continue;

                    if ((sockets[i].revents & POLLIN) || (sockets[i].revents & POLLPRI)) {
                        if (i < socket_control.get_n_msg_sockets()) {
                            //
                            // CONTROL_SOCKET: we got input from a worker thread
                            //
                            SocketControl::SocketInfo msg = SocketControl::receive_control_message(sockets[i].fd);
                            switch (msg.type) {
                                case SocketControl::FINISHED_AND_CONTINUE: {
                                    socket_control.add_dyn_socket(msg);
                                    dispatch_waiting(socket_control, thread_control, i, sockets[i].fd);
                                    break;
                                }
                                case SocketControl::FINISHED_AND_CLOSE: {
                                    close_socket(msg);
                                    dispatch_waiting(socket_control, thread_control, i, sockets[i].fd);
                                    break;
                                }
                                case SocketControl::FINISHED_AND_ABORT: {
                                    abort_socket(msg);
                                    dispatch_waiting(socket_control, thread_control, i, sockets[i].fd);
                                    break;
                                }
                                case SocketControl::SOCKET_CLOSED: {
                                    //
                                    // a control socket has been closed: the worker thread exited
                                    //
                                    (void) socket_control.remove(i);
                                    ::close(thread_control[i].control_pipe);
                                    thread_control.thread_delete(i);
                                    if (socket_control.get_n_msg_sockets() == 0) running = false;
                                    break;
                                }
                                default: {
                                    Server::logger()->error("A worker thread sent an unexpected message ({})",
                                                            static_cast<int>(msg.type));
                                }
                            }
                            break;
                        } else if (i == socket_control.get_stop_socket_id()) {
                            //
                            // STOP from signal thread
                            //
                            SocketControl::SocketInfo msg = SocketControl::receive_control_message(sockets[i].fd);
                            if (msg.type != SocketControl::EXIT) {
                                Server::logger()->error("Got unexpected message from stop pipe");
                            }
                            if (socket_control.get_ssl_socket_id() >= 0) {
                                (void) socket_control.remove(socket_control.get_ssl_socket_id());
                            }
                            if (socket_control.get_http_socket_id() >= 0) {
                                (void) socket_control.remove(socket_control.get_http_socket_id());
                            }
                            socket_control.close_all_dynsocks(close_socket);
                            socket_control.broadcast_exit();
                            running = false;
                            break;
                        } else if ((i == socket_control.get_http_socket_id()) || (i == socket_control.get_ssl_socket_id())) {
                            bool ssl = (i == socket_control.get_ssl_socket_id());
                            try {
                                SocketControl::SocketInfo sockid = accept_connection(sockets[i].fd, ssl);
                                socket_control.add_dyn_socket(sockid);
                                Server::logger()->debug("Accepted {}connection from {}:{}", ssl ? "SSL " : "",
                                                        sockid.peer_ip, sockid.peer_port);
                            } catch (const Error &err) {
                                Server::logger()->warn("Could not accept connection: {}", err.to_string());
                            }
                            break;
                        } else {
                            //
                            // DYN_SOCKET: a client socket has data. Dispatch the processing to a free
                            // thread or put the socket in the waiting queue
                            //
                            ThreadControl::ThreadMasterData tinfo;
                            if (thread_control.thread_pop(tinfo)) {
                                SocketControl::SocketInfo sockid = socket_control.remove(i);
                                sockid.type = SocketControl::PROCESS_REQUEST;
                                if (SocketControl::send_control_message(tinfo.control_pipe, sockid) < 0) {
                                    Server::logger()->error("Could not dispatch socket to worker: {}", strerror(errno));
                                    close_socket(sockid);
                                }
                            } else {
                                socket_control.move_to_waiting(i);
                            }
                            break;
                        }
                    } else if (sockets[i].revents & (POLLHUP | POLLERR | POLLNVAL)) {
                        if (i >= socket_control.get_dyn_socket_base()) {
                            //
                            // the client closed an idle connection
                            //
                            SocketControl::SocketInfo sockid = socket_control.remove(i);
                            close_socket(sockid);
                        } else if (i < socket_control.get_n_msg_sockets()) {
                            //
                            // hangup of a worker control pipe: the thread exited
                            //
                            (void) socket_control.remove(i);
                            thread_control.thread_delete(i);
                            if (socket_control.get_n_msg_sockets() == 0) running = false;
                        } else if ((i == socket_control.get_http_socket_id()) || (i == socket_control.get_ssl_socket_id())) {
                            Server::logger()->error("Listening socket failed");
                            (void) socket_control.remove(i);
                        } else {
                            Server::logger()->error("Got a HANGUP from an unknown socket (socket_id = {})", i);
                            (void) socket_control.remove(i);
                        }
                        break;
                    }
                }
            }
            Server::logger()->info("Server shutting down, waiting for the workers to finish...");
        } // ThreadControl joins the workers here

        //
        // wake up the signal thread if we were stopped by other means than a signal
        //
        pthread_kill(sighandler_thread.native_handle(), SIGTERM);
        sighandler_thread.join();

        ::close(_sockfd);
        _sockfd = -1;
        if (_ssl_sockfd >= 0) {
            ::close(_ssl_sockfd);
            _ssl_sockfd = -1;
        }
        ::close(stoppipe[0]);
        ::close(stoppipe[1]);
        stoppipe[0] = stoppipe[1] = -1;
        Server::logger()->info("Server stopped");
    }
    //=========================================================================

    void Server::stop() {
        SocketControl::SocketInfo sockid(SocketControl::EXIT, SocketControl::STOP_SOCKET);
        if (SocketControl::send_control_message(stoppipe[1], sockid) < 0) {
            Server::logger()->debug("Could not send stop message: {}", strerror(errno));
            return;
        }
        Server::logger()->debug("Sent stop message to stoppipe[1]={}", stoppipe[1]);
    }
    //=========================================================================

    void Server::addRoute(Connection::HttpMethod method_p, const std::string &path_p,
                          std::shared_ptr<RequestHandler> handler_p) {
        handler[method_p][path_p] = std::move(handler_p);
    }
    //=========================================================================

    ThreadStatus Server::processRequest(std::istream *ins, std::ostream *os, const std::string &peer_ip, int peer_port,
                                        bool secure, int &keep_alive) {
        if (ins->eof() || os->eof()) return CLOSE;
        try {
            Connection conn(ins, os);

            if (keep_alive <= 0) {
                conn.keepAlive(false);
            }
            keep_alive = conn.setupKeepAlive(_keep_alive_timeout);

            conn.peer_ip(peer_ip);
            conn.peer_port(peer_port);
            conn.secure(secure);

            try {
                if (conn.resetConnection()) {
                    conn.sendPreflight();
                    return conn.keepAlive() ? CONTINUE : CLOSE;
                }

                auto [req_handler, route] = getHandler(conn);
                if (req_handler != nullptr) {
                    req_handler->handler(conn, route);
                } else {
                    std::vector<Connection::HttpMethod> allowed = allowedMethods(conn.uri());
                    if (allowed.empty()) {
                        default_handler->handler(conn, conn.uri());
                    } else {
                        std::string allow_str;
                        for (auto m: allowed) {
                            allow_str += (allow_str.empty() ? "" : ", ") + Connection::method_as_string(m);
                        }
                        conn.header("Allow", allow_str);
                        if (conn.method() == Connection::OPTIONS) {
                            conn.status(Connection::NO_CONTENT);
                            conn.flush();
                        } else {
                            send_error(conn, Connection::METHOD_NOT_ALLOWED);
                        }
                    }
                }
            } catch (InputFailure &iofail) {
                Server::logger()->debug("Possibly socket closed by peer");
                conn.abort();
            } catch (const Error &err) {
                if (conn.headerSent()) {
                    Server::logger()->error("Internal error after the header was sent: {}", err.to_string());
                    conn.abort();
                } else {
                    send_error(conn, Connection::INTERNAL_SERVER_ERROR, err);
                }
            }

            std::string range = conn.header("range");
            Server::logger()->info("{}:{} \"{} {}\"{} {}{}", peer_ip, peer_port, Connection::method_as_string(conn.method()),
                                   conn.uri(), range.empty() ? "" : fmt::format(" range \"{}\"", range),
                                   static_cast<int>(conn.status()), conn.aborted() ? " (aborted)" : "");
            if (conn.aborted()) {
                return ABORT;
            }
            return conn.keepAlive() ? CONTINUE : CLOSE;
        } catch (InputFailure &iofail) { // thrown if the socket was closed or timed out
            Server::logger()->debug("Socket connection: timeout or socket closed");
            return CLOSE;
        } catch (const Error &err) {
            //
            // the request could not be parsed, we don't have a Connection here
            //
            Server::logger()->warn("Bad request from {}: {}", peer_ip, err.getMessage());
            try {
                std::string body = "Bad Request: " + err.getMessage();
                *os << "HTTP/1.1 400 Bad Request\r\n";
                *os << "Content-Type: text/plain\r\n";
                *os << "Connection: close\r\n";
                *os << "Content-Length: " << body.length() << "\r\n\r\n";
                *os << body;
                os->flush();
            } catch (const std::ios_base::failure &fail) {
                Server::logger()->debug("Possibly socket closed by peer");
            }
            return CLOSE;
        }
    }
    //=========================================================================

}
