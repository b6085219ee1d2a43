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
#include <cctype>
#include <limits>
#include <vector>

#include "fmt/format.h"

#include "Global.h"
#include "RangeTranslator.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    static const char bytes_unit[] = "bytes";

    /*!
     * Reads a decimal number. Returns false if there is no digit at the position.
     */
    static bool parse_pos(const std::string &s, size_t &pos, uint64_t &value) {
        const uint64_t max = std::numeric_limits<uint64_t>::max();
        size_t start = pos;
        value = 0;
        while ((pos < s.length()) && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            uint64_t digit = s[pos] - '0';
            if (value > (max - digit) / 10) {
                value = max; // saturate
            } else {
                value = value * 10 + digit;
            }
            ++pos;
        }
        return pos > start;
    }
    //=========================================================================

    static bool parse_range(const std::string &str, RangeSpec &spec) {
        std::string s = trim_copy(str);
        size_t pos = 0;
        if (s.empty()) return false;
        if (s[0] == '-') {
            spec.type = RangeSpec::SUFFIX;
            ++pos;
            if (!parse_pos(s, pos, spec.first)) return false;
        } else {
            if (!parse_pos(s, pos, spec.first)) return false;
            if ((pos >= s.length()) || (s[pos] != '-')) return false;
            ++pos;
            if (pos == s.length()) {
                spec.type = RangeSpec::PREFIX;
            } else {
                spec.type = RangeSpec::PART;
                if (!parse_pos(s, pos, spec.last)) return false;
            }
        }
        return pos == s.length();
    }
    //=========================================================================

    RangeHeader parse_range_header(const std::string &header) {
        RangeHeader result;

        size_t eq = header.find('=');
        if (eq == std::string::npos) return result;
        std::string unit = trim_copy(header.substr(0, eq));
        asciitolower(unit);
        if (unit != bytes_unit) return result;

        //
        // empty list elements are allowed by the RFC and skipped
        //
        std::vector<std::string> ranges;
        for (auto &item: split(header.substr(eq + 1), ',')) {
            if (!trim_copy(item).empty()) ranges.push_back(item);
        }
        if (ranges.empty()) return result;
        if (ranges.size() > 1) {
            result.type = RangeHeader::MULTIPLE;
            return result;
        }
        if (parse_range(ranges[0], result.spec)) {
            result.type = RangeHeader::SINGLE;
        }
        return result;
    }
    //=========================================================================

    Outcome<ByteRange> normalize_range(const RangeSpec &spec, uint64_t object_size) {
        RelayFault unsatisfiable(RelayFault::UNSATISFIABLE_RANGE,
                                 fmt::format("Range not satisfiable for object size {}", object_size), object_size);
        if (object_size == 0) return unsatisfiable;

        uint64_t last_byte = object_size - 1;
        switch (spec.type) {
            case RangeSpec::SUFFIX: {
                if (spec.first == 0) return unsatisfiable;
                uint64_t start = (spec.first >= object_size) ? 0 : object_size - spec.first;
                return ByteRange{start, last_byte};
            }
            case RangeSpec::PREFIX: {
                if (spec.first >= object_size) return unsatisfiable;
                return ByteRange{spec.first, last_byte};
            }
            case RangeSpec::PART: {
                if ((spec.first > spec.last) || (spec.first >= object_size)) return unsatisfiable;
                return ByteRange{spec.first, (spec.last > last_byte) ? last_byte : spec.last};
            }
        }
        return unsatisfiable;
    }
    //=========================================================================

    std::optional<RelayFault> check_upstream_range(int status, const std::string &content_range,
                                                   const ByteRange &requested) {
        if (status == Connection::OK) {
            if (requested.start == 0) return std::nullopt;
            return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                              fmt::format("Store ignored the range {}-{} and sent the whole object",
                                          requested.start, requested.end));
        }
        if (status != Connection::PARTIAL_CONTENT) {
            return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                              fmt::format("Unexpected status {} for range {}-{}", status, requested.start,
                                          requested.end));
        }
        if (content_range.empty()) return std::nullopt;

        //
        // "bytes first-last/size" (RFC 7233, 4.2)
        //
        std::string s = trim_copy(content_range);
        size_t sp = s.find(' ');
        std::string unit = s.substr(0, std::min(sp, s.length()));
        asciitolower(unit);
        size_t pos = sp + 1;
        uint64_t first = 0, last = 0;
        if ((sp == std::string::npos) || (unit != bytes_unit) || !parse_pos(s, pos, first) ||
            (pos >= s.length()) || (s[pos] != '-') || !parse_pos(s, ++pos, last) || (first > last)) {
            return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                              fmt::format("Invalid Content-Range \"{}\" from store", content_range));
        }
        if ((first != requested.start) || (last > requested.end)) {
            return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                              fmt::format("Store sent bytes {}-{} instead of {}-{}", first, last, requested.start,
                                          requested.end));
        }
        return std::nullopt;
    }
    //=========================================================================

    Outcome<ProxyResponse> RangeTranslator::translate(const std::string &key, const std::string &range_header) {
        Outcome<ObjectInfo> info = _store.headObject(key);
        if (!info.ok()) return info.fault();
        if (!info.value().exists) {
            return RelayFault(RelayFault::NOT_FOUND, fmt::format("Object \"{}\" not found", key));
        }
        uint64_t size = info.value().size;

        RangeHeader rh = parse_range_header(range_header);
        if (rh.type == RangeHeader::MULTIPLE) {
            return RelayFault(RelayFault::UNSATISFIABLE_RANGE, "Multiple ranges are not supported", size);
        }

        ProxyResponse resp;
        resp.object_size = size;
        resp.headers["Accept-Ranges"] = bytes_unit;
        if (rh.type == RangeHeader::IGNORE) {
            resp.status = Connection::OK;
            resp.content_length = size;
            if (size > 0) resp.range = ByteRange{0, size - 1};
        } else {
            Outcome<ByteRange> range = normalize_range(rh.spec, size);
            if (!range.ok()) return range.fault();
            resp.status = Connection::PARTIAL_CONTENT;
            resp.range = range.value();
            resp.content_length = range.value().end - range.value().start + 1;
            resp.headers["Content-Range"] = fmt::format("bytes {}-{}/{}", range.value().start, range.value().end, size);
        }
        resp.headers["Content-Length"] = std::to_string(resp.content_length);
        return resp;
    }
    //=========================================================================

}
