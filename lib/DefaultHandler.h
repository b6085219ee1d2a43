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
#ifndef BAMRELAY_DEFAULTHANDLER_H
#define BAMRELAY_DEFAULTHANDLER_H

#include "RequestHandler.h"

namespace bamrelay {

    /*!
     * Answers all requests no other handler is registered for with "404 Not Found"
     */
    class DefaultHandler : public RequestHandler {
        const static std::string _name;
    public:
        DefaultHandler() : RequestHandler() {}

        [[nodiscard]] const std::string &name() const override;

        void handler(Connection &conn, const std::string &route) override;
    };

}

#endif //BAMRELAY_DEFAULTHANDLER_H
