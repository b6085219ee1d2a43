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
#include <algorithm>
#include <cstring>

#include "Error.h"
#include "ChunkPipe.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    ChunkPipe::ChunkPipe(size_t capacity)
            : _head(0), _count(0), _closed(false), _cancelled(false), _discard(false) {
        if (capacity == 0) {
            throw Error(file_, __LINE__, "ChunkPipe needs a capacity > 0");
        }
        _ring.resize(capacity);
    }
    //=========================================================================

    std::streamsize ChunkPipe::xsputn(const char *s, std::streamsize n) {
        std::unique_lock<std::mutex> lock(_mutex);
        std::streamsize written = 0;
        while (written < n) {
            _writable.wait(lock, [this] { return _cancelled || _discard || (_count < _ring.size()); });
            if (_cancelled) break;
            if (_discard) return n;

            //
            // copy as much as fits, in at most two pieces (wrap around)
            //
            size_t tail = (_head + _count) % _ring.size();
            size_t space = _ring.size() - _count;
            size_t len = std::min(static_cast<size_t>(n - written), std::min(space, _ring.size() - tail));
            std::memcpy(_ring.data() + tail, s + written, len);
            _count += len;
            written += static_cast<std::streamsize>(len);
            _readable.notify_one();
        }
        return written;
    }
    //=========================================================================

    ChunkPipe::int_type ChunkPipe::overflow(int_type ch) {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        char c = traits_type::to_char_type(ch);
        return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
    }
    //=========================================================================

    Outcome<size_t> ChunkPipe::read(char *buf, size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        bool ready = _readable.wait_for(lock, timeout, [this] {
            return (_count > 0) || _closed || _cancelled || _fault.has_value();
        });
        if (!ready) {
            return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE, "Timeout while waiting for upstream data");
        }
        if (_count > 0) {
            size_t len = std::min(n, std::min(_count, _ring.size() - _head));
            std::memcpy(buf, _ring.data() + _head, len);
            _head = (_head + len) % _ring.size();
            _count -= len;
            _writable.notify_one();
            return len;
        }
        if (_fault.has_value()) return _fault.value();
        return static_cast<size_t>(0);
    }
    //=========================================================================

    void ChunkPipe::close() {
        std::unique_lock<std::mutex> lock(_mutex);
        _closed = true;
        _readable.notify_all();
    }
    //=========================================================================

    void ChunkPipe::fail(const RelayFault &fault) {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_fault.has_value()) _fault = fault;
        _closed = true;
        _readable.notify_all();
    }
    //=========================================================================

    void ChunkPipe::cancel() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cancelled = true;
        _writable.notify_all();
        _readable.notify_all();
    }
    //=========================================================================

    void ChunkPipe::discard() {
        std::unique_lock<std::mutex> lock(_mutex);
        _discard = true;
        _writable.notify_all();
    }
    //=========================================================================

    bool ChunkPipe::cancelled() {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cancelled;
    }
    //=========================================================================

}
