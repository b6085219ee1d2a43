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
#ifndef BAMRELAY_THREADCONTROL_H
#define BAMRELAY_THREADCONTROL_H

#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace bamrelay {

    class Server; // Declaration only

    /*!
     * \brief Pool of worker threads processing client connections
     *
     * Every worker is connected to the main thread by a socketpair ("control pipe"). The main thread
     * hands over a socket by sending a PROCESS_REQUEST message, the worker answers with a
     * FINISHED_* message when the request has been processed. Idle workers wait in a queue.
     */
    class ThreadControl {
    public:
        typedef struct {
            std::shared_ptr<std::thread> thread_ptr;
            int control_pipe; //!< master's end of the control socketpair
        } ThreadMasterData;

        typedef struct {
            int control_pipe; //!< worker's end of the control socketpair
            int result;
            Server *serv;
        } ThreadChildData;

        using ThreadFunction = std::function<void(ThreadChildData &thread_child_data)>;

    private:
        std::vector<ThreadMasterData> thread_list; //!< List of all threads
        std::vector<ThreadChildData> child_data;   //!< Data given to the threads. Never resized after start
        std::queue<ThreadMasterData> thread_queue; //!< Queue of threads waiting for work
        std::mutex thread_queue_mutex;

    public:
        /*!
         * Creates the given number of worker threads
         *
         * \param[in] n_threads Number of threads to create
         * \param[in] start_routine Function that the threads run
         * \param[in] serv Pointer to the server
         */
        ThreadControl(unsigned n_threads, const ThreadFunction &start_routine, Server *serv);

        ThreadControl(const ThreadControl &) = delete;

        ThreadControl &operator=(const ThreadControl &) = delete;

        /*!
         * Joins all worker threads. The workers must have been sent an EXIT message before.
         */
        ~ThreadControl();

        void thread_push(const ThreadMasterData &tinfo);

        /*!
         * Pop a thread from the queue of waiting threads
         *
         * \param[out] tinfo Thread info of popped thread
         * \returns true, if a thread was available
         */
        bool thread_pop(ThreadMasterData &tinfo);

        /*!
         * Remove a thread from the list of all threads (e.g. because it exited)
         *
         * \param[in] pos Position of the thread in the list
         * \returns Remaining number of threads
         */
        int thread_delete(int pos);

        ThreadMasterData &operator[](int index);

        [[nodiscard]] inline int nthreads() const { return static_cast<int>(thread_list.size()); }
    };

}

#endif //BAMRELAY_THREADCONTROL_H
