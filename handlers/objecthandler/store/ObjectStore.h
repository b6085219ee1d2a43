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
#ifndef BAMRELAY_OBJECTSTORE_H
#define BAMRELAY_OBJECTSTORE_H

#include <cstdint>
#include <memory>
#include <string>

#include "../RelayFault.h"

namespace bamrelay {

    typedef struct {
        bool exists;
        uint64_t size;
    } ObjectInfo;

    /*!
     * \brief Pull reader over one ranged read of an object
     *
     * The reader delivers the bytes in ascending order. It is not restartable.
     */
    class RangeReader {
    public:
        virtual ~RangeReader() = default;

        /*!
         * Reads the next bytes of the range. Blocks until data is available.
         *
         * \param[out] buf Buffer
         * \param[in] n Size of the buffer
         * \returns Number of bytes read, 0 at the end of the range, or a fault
         */
        virtual Outcome<size_t> next(char *buf, size_t n) = 0;

        /*!
         * Stops the transfer. Subsequent calls to next() return 0. May be called from any thread.
         */
        virtual void cancel() = 0;
    };

    /*!
     * \brief Interface of the object store the relay reads from
     */
    class ObjectStore {
    public:
        virtual ~ObjectStore() = default;

        /*!
         * Gets the size of an object. A missing object is not a fault, it returns exists = false.
         */
        virtual Outcome<ObjectInfo> headObject(const std::string &key) = 0;

        /*!
         * Opens a ranged read of the inclusive byte range [start, end]
         */
        virtual Outcome<std::unique_ptr<RangeReader>> getObjectRange(const std::string &key, uint64_t start, uint64_t end) = 0;
    };

}

#endif //BAMRELAY_OBJECTSTORE_H
