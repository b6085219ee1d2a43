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
 * Test doubles: an object store holding its objects in memory, with injectable failures, and
 * an output stream buffer that fails after a given number of bytes.
 */
#ifndef BAMRELAY_MEMORYOBJECTSTORE_H
#define BAMRELAY_MEMORYOBJECTSTORE_H

#include <algorithm>
#include <cstring>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <streambuf>
#include <string>
#include <utility>

#include "../handlers/objecthandler/store/ObjectStore.h"
#include "../handlers/objecthandler/RangeTranslator.h"

namespace bamrelay {

    class MemoryObjectStore : public ObjectStore {
    public:
        std::map<std::string, std::string> objects;

        bool fail_head{false};              //!< headObject() returns a transient fault
        bool fail_open{false};              //!< getObjectRange() returns a transient fault
        std::optional<size_t> short_after;  //!< the reader ends after this number of bytes
        std::optional<size_t> fail_after;   //!< the reader fails after this number of bytes
        size_t max_step{std::numeric_limits<size_t>::max()}; //!< maximal bytes per next()
        bool ignore_range{false};           //!< answers ranged reads with 200 and the whole object

        size_t head_calls{0};
        size_t readers_opened{0};
        size_t next_calls{0};
        size_t bytes_delivered{0};
        size_t cancel_calls{0};

        class Reader : public RangeReader {
        private:
            MemoryObjectStore &_store;
            std::string _data;
            size_t _pos{0};
            bool _cancelled{false};
            std::optional<RelayFault> _fault;

        public:
            Reader(MemoryObjectStore &store, std::string data, std::optional<RelayFault> fault = std::nullopt)
                    : _store(store), _data(std::move(data)), _fault(std::move(fault)) {}

            Outcome<size_t> next(char *buf, size_t n) override {
                _store.next_calls++;
                if (_cancelled) return static_cast<size_t>(0);
                if (_fault.has_value()) return _fault.value();
                if (_store.fail_after.has_value() && (_pos >= _store.fail_after.value())) {
                    return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE, "injected failure");
                }
                size_t end = _data.length();
                if (_store.short_after.has_value()) end = std::min(end, _store.short_after.value());
                if (_store.fail_after.has_value()) end = std::min(end, _store.fail_after.value());
                if (_pos >= end) return static_cast<size_t>(0);
                size_t k = std::min(std::min(n, end - _pos), _store.max_step);
                std::memcpy(buf, _data.data() + _pos, k);
                _pos += k;
                _store.bytes_delivered += k;
                return k;
            }

            void cancel() override {
                _cancelled = true;
                _store.cancel_calls++;
            }
        };

        Outcome<ObjectInfo> headObject(const std::string &key) override {
            head_calls++;
            if (fail_head) return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE, "injected head failure");
            auto obj = objects.find(key);
            if (obj == objects.end()) return ObjectInfo{false, 0};
            return ObjectInfo{true, obj->second.length()};
        }

        Outcome<std::unique_ptr<RangeReader>> getObjectRange(const std::string &key, uint64_t start, uint64_t end) override {
            if (fail_open) return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE, "injected open failure");
            auto obj = objects.find(key);
            if (obj == objects.end()) return RelayFault(RelayFault::NOT_FOUND, "no such object");
            readers_opened++;
            const std::string &data = obj->second;
            if (ignore_range) {
                std::unique_ptr<RangeReader> reader = std::make_unique<Reader>(
                        *this, data, check_upstream_range(200, "", ByteRange{start, end}));
                return std::move(reader);
            }
            std::string slice = (start < data.length()) ? data.substr(start, end - start + 1) : std::string();
            std::unique_ptr<RangeReader> reader = std::make_unique<Reader>(*this, slice);
            return std::move(reader);
        }
    };

    /*!
     * Output stream buffer that accepts a limited number of bytes, like a socket whose peer
     * went away
     */
    class LimitedSink : public std::streambuf {
    public:
        std::string data;
        size_t limit;

        explicit LimitedSink(size_t limit_p = std::numeric_limits<size_t>::max()) : limit(limit_p) {}

    protected:
        int_type overflow(int_type ch) override {
            if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
            if (data.length() >= limit) return traits_type::eof();
            data.push_back(traits_type::to_char_type(ch));
            return ch;
        }

        std::streamsize xsputn(const char *s, std::streamsize n) override {
            size_t room = (limit > data.length()) ? limit - data.length() : 0;
            size_t k = std::min(static_cast<size_t>(n), room);
            data.append(s, k);
            return static_cast<std::streamsize>(k);
        }
    };

    /*!
     * Creates an object of the given size with the byte at position i being (i * 7 + i / 251) % 256
     */
    inline std::string make_object(size_t size) {
        std::string obj(size, '\0');
        for (size_t i = 0; i < size; i++) {
            obj[i] = static_cast<char>((i * 7 + i / 251) % 256);
        }
        return obj;
    }

    /*!
     * Splits a raw HTTP response into the header part (including the status line) and the body
     */
    inline std::pair<std::string, std::string> split_response(const std::string &raw) {
        size_t pos = raw.find("\r\n\r\n");
        if (pos == std::string::npos) return {raw, ""};
        return {raw.substr(0, pos + 2), raw.substr(pos + 4)};
    }

}

#endif //BAMRELAY_MEMORYOBJECTSTORE_H
