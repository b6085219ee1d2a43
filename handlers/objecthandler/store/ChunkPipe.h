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
#ifndef BAMRELAY_CHUNKPIPE_H
#define BAMRELAY_CHUNKPIPE_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <streambuf>
#include <vector>

#include "../RelayFault.h"

namespace bamrelay {

    /*!
     * \brief Bounded pipe between a producer writing to a std::ostream and a consumer pulling chunks
     *
     * The producer side is a std::streambuf, so that a HTTP client library can write a response
     * body into it. If the pipe is full the producer blocks until the consumer has read data or
     * the pipe has been cancelled. After cancel() all writes fail, which makes the producer
     * abort its transfer.
     */
    class ChunkPipe : public std::streambuf {
    private:
        std::mutex _mutex;
        std::condition_variable _readable;
        std::condition_variable _writable;
        std::vector<char> _ring;
        size_t _head;     //!< position of the first unread byte
        size_t _count;    //!< number of unread bytes
        bool _closed;     //!< the producer has finished
        bool _cancelled;  //!< the consumer is no longer interested
        bool _discard;    //!< written data is dropped (e.g. an error document)
        std::optional<RelayFault> _fault;

    protected:
        std::streamsize xsputn(const char *s, std::streamsize n) override;

        int_type overflow(int_type ch) override;

    public:
        /*!
         * \param[in] capacity Maximal number of bytes buffered in the pipe
         */
        explicit ChunkPipe(size_t capacity);

        ChunkPipe(const ChunkPipe &) = delete;

        ChunkPipe &operator=(const ChunkPipe &) = delete;

        /*!
         * Reads at most n bytes. Blocks until data is available, the producer has finished or
         * failed, or the timeout expired.
         *
         * \returns The number of bytes read, 0 at the end of the data, or a fault
         * (UPSTREAM_TRANSIENT_FAILURE on timeout)
         */
        Outcome<size_t> read(char *buf, size_t n, std::chrono::milliseconds timeout);

        /*!
         * The producer has written all data
         */
        void close();

        /*!
         * The producer failed. The consumer gets the fault after all data written before.
         */
        void fail(const RelayFault &fault);

        /*!
         * Wakes up a blocked producer and makes all further writes fail
         */
        void cancel();

        /*!
         * All further writes succeed but the data is dropped
         */
        void discard();

        [[nodiscard]] bool cancelled();

        [[nodiscard]] inline size_t capacity() const { return _ring.size(); }
    };

}

#endif //BAMRELAY_CHUNKPIPE_H
