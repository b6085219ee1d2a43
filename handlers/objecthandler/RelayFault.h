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
#ifndef BAMRELAY_RELAYFAULT_H
#define BAMRELAY_RELAYFAULT_H

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace bamrelay {

    /*!
     * \brief A failure while translating or relaying an object request
     *
     * Faults are returned as values (see Outcome) and not thrown. Every fault type maps to
     * exactly one reaction of the relay.
     */
    class RelayFault {
    public:
        typedef enum {
            NOT_FOUND,                  //!< the object does not exist (404)
            UNSATISFIABLE_RANGE,        //!< the range cannot be served (416)
            UPSTREAM_TRANSIENT_FAILURE, //!< the store failed or timed out (502 or abort)
            UPSTREAM_SHORT_READ,        //!< the store ended the body early (abort)
            CLIENT_DISCONNECT           //!< writing to the client failed (silent stop)
        } FaultType;

    private:
        FaultType _type;
        std::string _message;
        uint64_t _object_size; //!< size of the object, used for "Content-Range: bytes */size"

    public:
        RelayFault(FaultType type, std::string message, uint64_t object_size = 0)
                : _type(type), _message(std::move(message)), _object_size(object_size) {}

        [[nodiscard]] inline FaultType type() const { return _type; }

        [[nodiscard]] inline const std::string &message() const { return _message; }

        [[nodiscard]] inline uint64_t object_size() const { return _object_size; }

        [[nodiscard]] static std::string type_as_string(FaultType type) {
            switch (type) {
                case NOT_FOUND: return "NotFound";
                case UNSATISFIABLE_RANGE: return "UnsatisfiableRange";
                case UPSTREAM_TRANSIENT_FAILURE: return "UpstreamTransientFailure";
                case UPSTREAM_SHORT_READ: return "UpstreamShortRead";
                case CLIENT_DISCONNECT: return "ClientDisconnect";
            }
            return "Unknown";
        }

        [[nodiscard]] inline std::string to_string() const {
            return type_as_string(_type) + ": " + _message;
        }
    };

    /*!
     * Holds either a value or a RelayFault
     *
     *     Outcome<ObjectInfo> info = store.headObject(key);
     *     if (!info.ok()) return info.fault();
     *
     * \tparam T Type of the value
     */
    template<typename T>
    class Outcome {
    private:
        std::variant<T, RelayFault> _data;

    public:
        Outcome(T value) : _data(std::move(value)) {}

        Outcome(RelayFault fault) : _data(std::move(fault)) {}

        [[nodiscard]] inline bool ok() const { return std::holds_alternative<T>(_data); }

        inline T &value() { return std::get<T>(_data); }

        [[nodiscard]] inline const T &value() const { return std::get<T>(_data); }

        [[nodiscard]] inline const RelayFault &fault() const { return std::get<RelayFault>(_data); }
    };

}

#endif //BAMRELAY_RELAYFAULT_H
