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
#include <memory>
#include <vector>

#include "fmt/format.h"

#include "StreamRelay.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    const size_t min_chunk_size = 64 * 1024;
    const size_t max_chunk_size = 1024 * 1024;
    const size_t default_chunk_size = 256 * 1024;

    size_t clamp_chunk_size(size_t chunk_size) {
        return std::clamp(chunk_size, min_chunk_size, max_chunk_size);
    }
    //=========================================================================

    StreamRelay::StreamRelay(ObjectStore &store, const RelayOptions &options)
            : _store(store), _chunk_size(clamp_chunk_size(options.chunk_size)), _content_type(options.content_type) {
        if (_content_type.empty()) _content_type = "application/octet-stream";
    }
    //=========================================================================

    void StreamRelay::commit(Connection &conn, const ProxyResponse &resp) {
        conn.status(resp.status);
        conn.header("Content-Type", _content_type);
        for (auto const &[name, value]: resp.headers) {
            conn.header(name, value);
        }
        conn.sendHeader(resp.content_length);
    }
    //=========================================================================

    Outcome<uint64_t> StreamRelay::relay(Connection &conn, const std::string &key, const ProxyResponse &resp) {
        //
        // no body to send: an empty object or a HEAD request
        //
        if ((resp.content_length == 0) || !resp.range.has_value() || (conn.method() == Connection::HEAD)) {
            try {
                commit(conn, resp);
            } catch (InputFailure &iofail) {
                conn.abort();
                return RelayFault(RelayFault::CLIENT_DISCONNECT, "Client closed the connection");
            }
            return static_cast<uint64_t>(0);
        }

        ByteRange range = resp.range.value();
        Outcome<std::unique_ptr<RangeReader>> opened = _store.getObjectRange(key, range.start, range.end);
        if (!opened.ok()) return opened.fault();
        std::unique_ptr<RangeReader> reader = std::move(opened.value());

        std::vector<char> buf(_chunk_size);
        uint64_t remaining = resp.content_length;
        uint64_t sent = 0;

        //
        // wait for the first chunk before the status line is sent
        //
        Outcome<size_t> n = reader->next(buf.data(), static_cast<size_t>(std::min<uint64_t>(_chunk_size, remaining)));
        if (!n.ok()) return n.fault();
        if (n.value() == 0) {
            return RelayFault(RelayFault::UPSTREAM_SHORT_READ,
                              fmt::format("Upstream sent no data for \"{}\" bytes {}-{}", key, range.start, range.end));
        }

        try {
            commit(conn, resp);
        } catch (InputFailure &iofail) {
            reader->cancel();
            conn.abort();
            return RelayFault(RelayFault::CLIENT_DISCONNECT, "Client closed the connection");
        }

        while (true) {
            try {
                conn.sendData(buf.data(), n.value());
            } catch (InputFailure &iofail) {
                reader->cancel();
                conn.abort();
                return RelayFault(RelayFault::CLIENT_DISCONNECT,
                                  fmt::format("Client closed the connection after {} of {} bytes", sent,
                                              resp.content_length));
            }
            sent += n.value();
            remaining -= n.value();
            if (remaining == 0) break;

            n = reader->next(buf.data(), static_cast<size_t>(std::min<uint64_t>(_chunk_size, remaining)));
            if (!n.ok()) {
                conn.abort();
                return RelayFault(n.fault().type(), fmt::format("{} after {} of {} bytes", n.fault().message(), sent,
                                                                resp.content_length));
            }
            if (n.value() == 0) {
                conn.abort();
                return RelayFault(RelayFault::UPSTREAM_SHORT_READ,
                                  fmt::format("Upstream ended \"{}\" after {} of {} bytes", key, sent,
                                              resp.content_length));
            }
        }
        return sent;
    }
    //=========================================================================

}
