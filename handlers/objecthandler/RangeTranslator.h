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
/*!
 * \brief Translation of a HTTP Range header (RFC 7233) into an upstream byte range
 */
#ifndef BAMRELAY_RANGETRANSLATOR_H
#define BAMRELAY_RANGETRANSLATOR_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "Connection.h"
#include "RelayFault.h"
#include "store/ObjectStore.h"

namespace bamrelay {

    /*!
     * One byte range as given by the client
     */
    struct RangeSpec {
        enum RangeType {
            PREFIX, //!< "N-": from N to the end of the object
            PART,   //!< "N-M": from N to M (inclusive)
            SUFFIX  //!< "-N": the last N bytes
        };

        RangeType type{PART};
        uint64_t first{0}; //!< first byte (PREFIX, PART) or suffix length (SUFFIX)
        uint64_t last{0};  //!< last byte (PART only)
    };

    /*!
     * Validated inclusive byte range within the object
     */
    typedef struct {
        uint64_t start;
        uint64_t end;
    } ByteRange;

    /*!
     * Result of parsing a Range header
     */
    struct RangeHeader {
        enum HeaderType {
            IGNORE,   //!< absent, malformed or not in bytes: the full object is sent
            SINGLE,   //!< exactly one byte range
            MULTIPLE  //!< more than one byte range, which is not supported
        };

        HeaderType type{IGNORE};
        RangeSpec spec{};
    };

    /*!
     * \brief Status and header of the response to an object request
     */
    struct ProxyResponse {
        Connection::StatusCodes status{Connection::OK}; //!< 200 or 206
        uint64_t object_size{0};                        //!< size of the complete object
        uint64_t content_length{0};                     //!< number of body bytes
        std::optional<ByteRange> range;                 //!< range to read, empty if the body is empty
        std::map<std::string, std::string> headers;
    };

    /*!
     * Parses the value of a Range header. Numbers too large for 64 bit saturate.
     *
     * \param[in] header Value of the header, an empty string if the header is absent
     * \returns The parsed header
     */
    extern RangeHeader parse_range_header(const std::string &header);

    /*!
     * Validates a range against the size of the object and converts it to an inclusive
     * byte range. An end beyond the object is clamped to the last byte.
     *
     * \returns The byte range or a UNSATISFIABLE_RANGE fault
     */
    extern Outcome<ByteRange> normalize_range(const RangeSpec &spec, uint64_t object_size);

    /*!
     * Checks that the answer of the store to a ranged GET starts at the requested byte.
     * A store that ignores the Range header answers with 200 and the object from byte 0.
     *
     * \param[in] status HTTP status of the store's response (2xx)
     * \param[in] content_range Value of its Content-Range header, empty if absent
     * \param[in] requested The range sent to the store
     * \returns Empty if the body may be relayed, otherwise a UPSTREAM_TRANSIENT_FAILURE fault
     */
    extern std::optional<RelayFault> check_upstream_range(int status, const std::string &content_range,
                                                          const ByteRange &requested);

    /*!
     * \brief Determines status, header and byte range of an object request
     */
    class RangeTranslator {
    private:
        ObjectStore &_store;

    public:
        explicit RangeTranslator(ObjectStore &store) : _store(store) {}

        /*!
         * Gets the size of the object and builds the response for the given Range header.
         *
         * \param[in] key Object key
         * \param[in] range_header Value of the Range header, empty if absent
         * \returns Response description, or a NOT_FOUND, UNSATISFIABLE_RANGE or
         * UPSTREAM_TRANSIENT_FAILURE fault
         */
        Outcome<ProxyResponse> translate(const std::string &key, const std::string &range_header);
    };

}

#endif //BAMRELAY_RANGETRANSLATOR_H
