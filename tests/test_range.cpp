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
#include "catch2/catch_all.hpp"

#include <limits>

#include "Global.h"
#include "RangeTranslator.h"
#include "MemoryObjectStore.h"

using bamrelay::ByteRange;
using bamrelay::RangeHeader;
using bamrelay::RangeSpec;
using bamrelay::RelayFault;

TEST_CASE("Parsing Range headers", "[RangeTranslator]") {
    SECTION("Single ranges") {
        RangeHeader rh = bamrelay::parse_range_header("bytes=200-299");
        REQUIRE(rh.type == RangeHeader::SINGLE);
        REQUIRE(rh.spec.type == RangeSpec::PART);
        REQUIRE(rh.spec.first == 200);
        REQUIRE(rh.spec.last == 299);

        rh = bamrelay::parse_range_header("bytes=500-");
        REQUIRE(rh.type == RangeHeader::SINGLE);
        REQUIRE(rh.spec.type == RangeSpec::PREFIX);
        REQUIRE(rh.spec.first == 500);

        rh = bamrelay::parse_range_header("bytes=-100");
        REQUIRE(rh.type == RangeHeader::SINGLE);
        REQUIRE(rh.spec.type == RangeSpec::SUFFIX);
        REQUIRE(rh.spec.first == 100);

        rh = bamrelay::parse_range_header("Bytes = 0-0 ");
        REQUIRE(rh.type == RangeHeader::SINGLE);
        REQUIRE(rh.spec.first == 0);
        REQUIRE(rh.spec.last == 0);

        rh = bamrelay::parse_range_header("bytes=0-9,");
        REQUIRE(rh.type == RangeHeader::SINGLE);
    }

    SECTION("Ignored headers") {
        REQUIRE(bamrelay::parse_range_header("").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("items=0-9").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=-").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=abc-def").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=10-x").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=1 0-20").type == RangeHeader::IGNORE);
    }

    SECTION("Non-ASCII bytes") {
        REQUIRE(bamrelay::trim_copy("\xa0\xe9t\xe9 \xff") == "\xa0\xe9t\xe9 \xff");
        REQUIRE(bamrelay::trim_copy(" \xff ") == "\xff");
        REQUIRE(bamrelay::parse_range_header("bytes=\xe9\xff" "0-9").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("\xc3\xa9=0-9").type == RangeHeader::IGNORE);
        REQUIRE(bamrelay::parse_range_header("bytes=0-9\x85").type == RangeHeader::IGNORE);
    }

    SECTION("Multiple ranges") {
        REQUIRE(bamrelay::parse_range_header("bytes=0-9,20-29").type == RangeHeader::MULTIPLE);
        REQUIRE(bamrelay::parse_range_header("bytes=0-9, -5").type == RangeHeader::MULTIPLE);
    }

    SECTION("Huge numbers saturate") {
        RangeHeader rh = bamrelay::parse_range_header("bytes=99999999999999999999999-");
        REQUIRE(rh.type == RangeHeader::SINGLE);
        REQUIRE(rh.spec.first == std::numeric_limits<uint64_t>::max());
    }
}

static RangeSpec make_spec(RangeSpec::RangeType type, uint64_t first, uint64_t last = 0) {
    RangeSpec spec;
    spec.type = type;
    spec.first = first;
    spec.last = last;
    return spec;
}

TEST_CASE("Normalizing ranges", "[RangeTranslator]") {
    SECTION("Valid ranges") {
        auto r = bamrelay::normalize_range(make_spec(RangeSpec::PART, 200, 299), 1000);
        REQUIRE(r.ok());
        REQUIRE(r.value().start == 200);
        REQUIRE(r.value().end == 299);

        r = bamrelay::normalize_range(make_spec(RangeSpec::PART, 900, 2000), 1000);
        REQUIRE(r.ok());
        REQUIRE(r.value().start == 900);
        REQUIRE(r.value().end == 999);

        r = bamrelay::normalize_range(make_spec(RangeSpec::PREFIX, 999), 1000);
        REQUIRE(r.ok());
        REQUIRE(r.value().start == 999);
        REQUIRE(r.value().end == 999);

        r = bamrelay::normalize_range(make_spec(RangeSpec::SUFFIX, 100), 1000);
        REQUIRE(r.ok());
        REQUIRE(r.value().start == 900);
        REQUIRE(r.value().end == 999);

        r = bamrelay::normalize_range(make_spec(RangeSpec::SUFFIX, 5000), 1000);
        REQUIRE(r.ok());
        REQUIRE(r.value().start == 0);
        REQUIRE(r.value().end == 999);
    }

    SECTION("Unsatisfiable ranges") {
        auto r = bamrelay::normalize_range(make_spec(RangeSpec::PART, 1000, 1100), 1000);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.fault().type() == RelayFault::UNSATISFIABLE_RANGE);
        REQUIRE(r.fault().object_size() == 1000);

        REQUIRE_FALSE(bamrelay::normalize_range(make_spec(RangeSpec::PART, 300, 200), 1000).ok());
        REQUIRE_FALSE(bamrelay::normalize_range(make_spec(RangeSpec::PREFIX, 1000), 1000).ok());
        REQUIRE_FALSE(bamrelay::normalize_range(make_spec(RangeSpec::SUFFIX, 0), 1000).ok());
        REQUIRE_FALSE(bamrelay::normalize_range(make_spec(RangeSpec::PART, 0, 0), 0).ok());
        REQUIRE_FALSE(bamrelay::normalize_range(make_spec(RangeSpec::SUFFIX, 10), 0).ok());
    }
}

TEST_CASE("Translating object requests", "[RangeTranslator]") {
    bamrelay::MemoryObjectStore store;
    store.objects["sample1/reads.bam"] = bamrelay::make_object(1000);
    store.objects["empty.bam"] = "";
    bamrelay::RangeTranslator translator(store);

    SECTION("No Range header") {
        auto resp = translator.translate("sample1/reads.bam", "");
        REQUIRE(resp.ok());
        REQUIRE(resp.value().status == bamrelay::Connection::OK);
        REQUIRE(resp.value().object_size == 1000);
        REQUIRE(resp.value().content_length == 1000);
        REQUIRE(resp.value().range.value().start == 0);
        REQUIRE(resp.value().range.value().end == 999);
        REQUIRE(resp.value().headers.at("Accept-Ranges") == "bytes");
        REQUIRE(resp.value().headers.at("Content-Length") == "1000");
        REQUIRE(resp.value().headers.count("Content-Range") == 0);
        REQUIRE(store.head_calls == 1);
    }

    SECTION("Partial range") {
        auto resp = translator.translate("sample1/reads.bam", "bytes=200-299");
        REQUIRE(resp.ok());
        REQUIRE(resp.value().status == bamrelay::Connection::PARTIAL_CONTENT);
        REQUIRE(resp.value().content_length == 100);
        REQUIRE(resp.value().headers.at("Content-Range") == "bytes 200-299/1000");
        REQUIRE(resp.value().headers.at("Content-Length") == "100");
    }

    SECTION("Range beyond the end is clamped") {
        auto resp = translator.translate("sample1/reads.bam", "bytes=900-2000");
        REQUIRE(resp.ok());
        REQUIRE(resp.value().status == bamrelay::Connection::PARTIAL_CONTENT);
        REQUIRE(resp.value().content_length == 100);
        REQUIRE(resp.value().headers.at("Content-Range") == "bytes 900-999/1000");
    }

    SECTION("Malformed Range header serves the whole object") {
        auto resp = translator.translate("sample1/reads.bam", "bytes=a-b");
        REQUIRE(resp.ok());
        REQUIRE(resp.value().status == bamrelay::Connection::OK);
        REQUIRE(resp.value().content_length == 1000);
    }

    SECTION("Unsatisfiable and multiple ranges") {
        auto resp = translator.translate("sample1/reads.bam", "bytes=1000-");
        REQUIRE_FALSE(resp.ok());
        REQUIRE(resp.fault().type() == RelayFault::UNSATISFIABLE_RANGE);
        REQUIRE(resp.fault().object_size() == 1000);

        resp = translator.translate("sample1/reads.bam", "bytes=0-9,20-29");
        REQUIRE_FALSE(resp.ok());
        REQUIRE(resp.fault().type() == RelayFault::UNSATISFIABLE_RANGE);
        REQUIRE(resp.fault().object_size() == 1000);
    }

    SECTION("Empty object") {
        auto resp = translator.translate("empty.bam", "");
        REQUIRE(resp.ok());
        REQUIRE(resp.value().status == bamrelay::Connection::OK);
        REQUIRE(resp.value().content_length == 0);
        REQUIRE_FALSE(resp.value().range.has_value());

        resp = translator.translate("empty.bam", "bytes=0-");
        REQUIRE_FALSE(resp.ok());
        REQUIRE(resp.fault().type() == RelayFault::UNSATISFIABLE_RANGE);
        REQUIRE(resp.fault().object_size() == 0);
    }

    SECTION("Missing object") {
        auto resp = translator.translate("sample1/missing.bai", "bytes=0-9");
        REQUIRE_FALSE(resp.ok());
        REQUIRE(resp.fault().type() == RelayFault::NOT_FOUND);
    }

    SECTION("Store failure") {
        store.fail_head = true;
        auto resp = translator.translate("sample1/reads.bam", "bytes=0-9");
        REQUIRE_FALSE(resp.ok());
        REQUIRE(resp.fault().type() == RelayFault::UPSTREAM_TRANSIENT_FAILURE);
        REQUIRE(store.readers_opened == 0);
    }
}

TEST_CASE("Checking the store's answer to a ranged read", "[RangeTranslator]") {
    SECTION("Partial content at the requested offset") {
        REQUIRE_FALSE(bamrelay::check_upstream_range(206, "bytes 1000-1999/50000", ByteRange{1000, 1999}).has_value());
        REQUIRE_FALSE(bamrelay::check_upstream_range(206, "Bytes 1000-1499/1500", ByteRange{1000, 1999}).has_value());
        REQUIRE_FALSE(bamrelay::check_upstream_range(206, "", ByteRange{1000, 1999}).has_value());
    }

    SECTION("Whole object instead of a range") {
        REQUIRE_FALSE(bamrelay::check_upstream_range(200, "", ByteRange{0, 999}).has_value());
        auto fault = bamrelay::check_upstream_range(200, "", ByteRange{1000, 1999});
        REQUIRE(fault.has_value());
        REQUIRE(fault.value().type() == RelayFault::UPSTREAM_TRANSIENT_FAILURE);
    }

    SECTION("Wrong or invalid Content-Range") {
        REQUIRE(bamrelay::check_upstream_range(206, "bytes 0-999/50000", ByteRange{1000, 1999}).has_value());
        REQUIRE(bamrelay::check_upstream_range(206, "bytes 1000-2999/50000", ByteRange{1000, 1999}).has_value());
        REQUIRE(bamrelay::check_upstream_range(206, "bytes */50000", ByteRange{1000, 1999}).has_value());
        REQUIRE(bamrelay::check_upstream_range(206, "items 1000-1999/50000", ByteRange{1000, 1999}).has_value());
        REQUIRE(bamrelay::check_upstream_range(206, "garbage", ByteRange{1000, 1999}).has_value());
    }

    SECTION("Other success codes") {
        auto fault = bamrelay::check_upstream_range(204, "", ByteRange{0, 99});
        REQUIRE(fault.has_value());
        REQUIRE(fault.value().type() == RelayFault::UPSTREAM_TRANSIENT_FAILURE);
    }
}
