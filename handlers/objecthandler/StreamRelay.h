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
#ifndef BAMRELAY_STREAMRELAY_H
#define BAMRELAY_STREAMRELAY_H

#include <cstdint>
#include <string>

#include "Connection.h"
#include "RelayFault.h"
#include "RangeTranslator.h"
#include "store/ObjectStore.h"

namespace bamrelay {

    extern const size_t min_chunk_size;
    extern const size_t max_chunk_size;
    extern const size_t default_chunk_size;

    typedef struct {
        size_t chunk_size;        //!< number of bytes copied per step
        std::string content_type; //!< Content-Type of the proxied responses
    } RelayOptions;

    /*!
     * Limits a chunk size to the range [min_chunk_size, max_chunk_size]
     */
    extern size_t clamp_chunk_size(size_t chunk_size);

    /*!
     * \brief Copies a byte range of an object from the store to the client
     *
     * The status line and the header are sent only after the first chunk has arrived from
     * the store. Until then every failure can still be answered by an error response. Later
     * failures abort the connection, since the client would otherwise take a truncated body
     * for a complete one.
     */
    class StreamRelay {
    private:
        ObjectStore &_store;
        size_t _chunk_size;
        std::string _content_type;

        void commit(Connection &conn, const ProxyResponse &resp);

    public:
        StreamRelay(ObjectStore &store, const RelayOptions &options);

        [[nodiscard]] inline size_t chunk_size() const { return _chunk_size; }

        /*!
         * Sends the response described by resp and streams the body from the store.
         *
         * \param[in] conn Connection to the client
         * \param[in] key Object key
         * \param[in] resp Response as built by the RangeTranslator
         * \returns The number of body bytes sent or a fault. If conn.headerSent() is false
         * after a fault, the caller must send the error response.
         */
        Outcome<uint64_t> relay(Connection &conn, const std::string &key, const ProxyResponse &resp);
    };

}

#endif //BAMRELAY_STREAMRELAY_H
