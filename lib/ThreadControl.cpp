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
#include <cstring>

#include <sys/socket.h>

#include "Error.h"
#include "Bamrelay.h"
#include "ThreadControl.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    ThreadControl::ThreadControl(unsigned n_threads, const ThreadFunction &start_routine, Server *serv) {
        //
        // all child data has to exist before the first thread starts, since the threads get a
        // reference into the vector. The "result" field temporarily holds the master's end of the pipe.
        //
        child_data.reserve(n_threads);
        for (unsigned n = 0; n < n_threads; n++) {
            int control_pipe[2];
            if (socketpair(PF_LOCAL, SOCK_STREAM, 0, control_pipe) != 0) {
                throw Error(file_, __LINE__, "Creating control pipe failed", errno);
            }
            child_data.push_back({control_pipe[1], control_pipe[0], serv});
        }

        for (auto &child: child_data) {
            ThreadMasterData thread_data;
            thread_data.control_pipe = child.result;
            child.result = 0;
            thread_data.thread_ptr = std::make_shared<std::thread>(start_routine, std::ref(child));
            thread_list.push_back(thread_data);
            thread_push(thread_data);
        }
        Server::logger()->debug("Created {} worker threads", n_threads);
    }
    //=========================================================================

    ThreadControl::~ThreadControl() {
        for (auto const &thread_data : thread_list) {
            if (thread_data.thread_ptr->joinable()) thread_data.thread_ptr->join();
        }
    }
    //=========================================================================

    void ThreadControl::thread_push(const ThreadMasterData &tinfo) {
        std::unique_lock<std::mutex> thread_queue_guard(thread_queue_mutex);
        thread_queue.push(tinfo);
    }
    //=========================================================================

    bool ThreadControl::thread_pop(ThreadMasterData &tinfo) {
        std::unique_lock<std::mutex> thread_queue_guard(thread_queue_mutex);
        if (thread_queue.empty()) {
            return false;
        }
        tinfo = thread_queue.front();
        thread_queue.pop();
        return true;
    }
    //=========================================================================

    ThreadControl::ThreadMasterData &ThreadControl::operator[](int index) {
        if (index < 0 || index >= static_cast<int>(thread_list.size())) {
            throw Error(file_, __LINE__, "Thread index out of range: " + std::to_string(index));
        }
        return thread_list[index];
    }
    //=========================================================================

    int ThreadControl::thread_delete(int pos) {
        auto &thread_data = (*this)[pos];
        if (thread_data.thread_ptr->joinable()) thread_data.thread_ptr->join();
        thread_list.erase(thread_list.begin() + pos);
        return static_cast<int>(thread_list.size());
    }
    //=========================================================================

}
