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
#include <vector>

#include "fmt/format.h"

#include "Bamrelay.h"
#include "RangeTranslator.h"
#include "store/S3ObjectStore.h"
#include "ObjectHandler.h"

static const char file_[] = __FILE__;

namespace bamrelay {

    const std::string ObjectHandler::_name = "objecthandler";

    const std::string &ObjectHandler::name() const {
        return _name;
    }
    //=========================================================================

    void ObjectHandler::send_fault(Connection &conn, const RelayFault &fault) {
        switch (fault.type()) {
            case RelayFault::NOT_FOUND: {
                conn.status(Connection::NOT_FOUND);
                conn.header("Content-Type", _relay_options.content_type);
                conn.header("Accept-Ranges", "bytes");
                conn.sendHeader(0);
                break;
            }
            case RelayFault::UNSATISFIABLE_RANGE: {
                conn.status(Connection::REQUEST_RANGE_NOT_SATISFIABLE);
                conn.header("Content-Type", _relay_options.content_type);
                conn.header("Accept-Ranges", "bytes");
                conn.header("Content-Range", fmt::format("bytes */{}", fault.object_size()));
                conn.sendHeader(0);
                break;
            }
            case RelayFault::UPSTREAM_TRANSIENT_FAILURE:
            case RelayFault::UPSTREAM_SHORT_READ: {
                Server::logger()->warn("{} {}: {}", Connection::method_as_string(conn.method()), conn.uri(),
                                       fault.to_string());
                conn.status(Connection::BAD_GATEWAY);
                conn.setBuffer();
                conn.header("Content-Type", "text/plain");
                conn.header("Accept-Ranges", "bytes");
                conn << "Bad Gateway: Object store failure";
                conn.flush();
                break;
            }
            case RelayFault::CLIENT_DISCONNECT:
                break;
        }
    }
    //=========================================================================

    void ObjectHandler::handler(Connection &conn, const std::string &route) {
        if (_store == nullptr) {
            throw Error(file_, __LINE__, "No object store configured");
        }

        std::string key = conn.uri().substr(route.length());
        key = urldecode(key.substr(std::min(key.find_first_not_of('/'), key.length())));
        std::string range_header = conn.header("range");

        if (key.empty()) {
            send_fault(conn, RelayFault(RelayFault::NOT_FOUND, "No object key given"));
            return;
        }

        RangeTranslator translator(*_store);
        Outcome<ProxyResponse> resp = translator.translate(key, range_header);
        if (!resp.ok()) {
            send_fault(conn, resp.fault());
            return;
        }

        StreamRelay relay(*_store, _relay_options);
        Outcome<uint64_t> result = relay.relay(conn, key, resp.value());
        if (result.ok()) {
            Server::logger()->debug("{} \"{}\": {} bytes sent", Connection::method_as_string(conn.method()), key,
                                    result.value());
            return;
        }

        const RelayFault &fault = result.fault();
        if (fault.type() == RelayFault::CLIENT_DISCONNECT) {
            Server::logger()->debug("{} \"{}\": {}", Connection::method_as_string(conn.method()), key, fault.message());
        } else if (!conn.headerSent()) {
            send_fault(conn, fault);
        } else {
            Server::logger()->error("{} \"{}\" range \"{}\" aborted: {}", Connection::method_as_string(conn.method()),
                                    key, range_header, fault.to_string());
        }
    }
    //=========================================================================

    void ObjectHandler::set_config_variables(BamrelayConf &conf) {
        std::vector<RouteInfo> routes = {
                RouteInfo("GET:/files:s3"),
                RouteInfo("HEAD:/files:s3")
        };
        conf.add_config(_name, "routes", routes, "Routes of the object handler");
        conf.add_config(_name, "s3bucket", "", "S3 bucket holding the objects.");
        conf.add_config(_name, "s3region", "us-east-1", "Region of the S3 bucket.");
        conf.add_config(_name, "s3endpoint", "", "Endpoint of a S3 compatible store (e.g. \"minio:9000\"), empty for AWS.");
        conf.add_config(_name, "s3scheme", "https", "Scheme used to access the store (http or https).");
        conf.add_config(_name, "s3pathstyle", false, "Use path style addressing (required by most S3 compatible stores).");
        conf.add_config(_name, "s3connecttimeout", 5, "Connect timeout for the object store in seconds.");
        conf.add_config(_name, "s3requesttimeout", 30, "Request timeout for the object store in seconds.");
        conf.add_config(_name, "chunksize", DataSize(default_chunk_size), "Number of bytes copied per step (64KB to 1MB).");
        conf.add_config(_name, "chunktimeout", 30, "Seconds to wait for the next chunk from the object store.");
        conf.add_config(_name, "contenttype", "application/octet-stream", "Content-Type of the served objects.");
    }
    //=========================================================================

    void ObjectHandler::get_config_variables(const BamrelayConf &conf) {
        size_t chunk_size = conf.get_datasize("chunksize").value_or(DataSize(default_chunk_size)).as_size_t();
        _relay_options.chunk_size = clamp_chunk_size(chunk_size);
        if (_relay_options.chunk_size != chunk_size) {
            Server::logger()->warn("Chunk size {} out of range, using {}", data_volume(chunk_size),
                                   data_volume(_relay_options.chunk_size));
        }
        _relay_options.content_type = conf.get_string("contenttype").value_or("application/octet-stream");

        if (_store != nullptr) return;

        S3StoreOptions options;
        options.bucket = conf.get_string("s3bucket").value_or("");
        options.region = conf.get_string("s3region").value_or("us-east-1");
        options.endpoint = conf.get_string("s3endpoint").value_or("");
        options.scheme = conf.get_string("s3scheme").value_or("https");
        options.pathstyle = conf.get_bool("s3pathstyle").value_or(false);
        options.connect_timeout = conf.get_int("s3connecttimeout").value_or(5);
        options.request_timeout = conf.get_int("s3requesttimeout").value_or(30);
        options.chunk_timeout = conf.get_int("chunktimeout").value_or(30);
        options.pipe_capacity = _relay_options.chunk_size;
        _store = std::make_shared<S3ObjectStore>(options);
    }
    //=========================================================================

}
