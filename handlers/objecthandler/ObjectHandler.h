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
#ifndef BAMRELAY_OBJECTHANDLER_H
#define BAMRELAY_OBJECTHANDLER_H

#include <memory>
#include <string>
#include <utility>

#include "RequestHandler.h"
#include "RelayFault.h"
#include "StreamRelay.h"
#include "store/ObjectStore.h"

namespace bamrelay {

    /*!
     * \brief Serves byte ranges of the objects of an object store
     *
     * The object key is the URL decoded part of the path following the route, e.g. the request
     * "GET /files/sample1/reads.bam" on the route "/files" reads the object "sample1/reads.bam".
     * The index of a BAM file is the object with the same key and the extension ".bai".
     */
    class ObjectHandler : public RequestHandler {
    private:
        const static std::string _name;
        std::shared_ptr<ObjectStore> _store;
        RelayOptions _relay_options;

        void send_fault(Connection &conn, const RelayFault &fault);

    public:
        /*!
         * The store is created from the configuration in get_config_variables()
         */
        ObjectHandler() : RequestHandler(), _relay_options{default_chunk_size, "application/octet-stream"} {}

        ObjectHandler(std::shared_ptr<ObjectStore> store, const RelayOptions &relay_options)
                : RequestHandler(), _store(std::move(store)), _relay_options(relay_options) {}

        [[nodiscard]] const std::string &name() const override;

        void handler(Connection &conn, const std::string &route) override;

        void set_config_variables(BamrelayConf &conf) override;

        void get_config_variables(const BamrelayConf &conf) override;
    };

}

#endif //BAMRELAY_OBJECTHANDLER_H
