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
#ifndef BAMRELAY_PINGHANDLER_H
#define BAMRELAY_PINGHANDLER_H

#include <string>

#include "RequestHandler.h"

namespace bamrelay {

    /*!
     * Answers liveness probes with a configurable text
     */
    class PingHandler : public RequestHandler {
    private:
        const static std::string _name;
        std::string _echo{"PONG"};
    public:
        PingHandler() : RequestHandler() {}

        [[nodiscard]] const std::string &name() const override;

        void handler(Connection &conn, const std::string &route) override;

        void set_config_variables(BamrelayConf &conf) override;

        void get_config_variables(const BamrelayConf &conf) override;
    };

}

#endif //BAMRELAY_PINGHANDLER_H
