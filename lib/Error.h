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
#ifndef BAMRELAY_ERROR_H
#define BAMRELAY_ERROR_H

#include <iostream>
#include <string>
#include <exception>
#include <stdexcept>

namespace bamrelay {

    /*!
     * \brief Class used to throw errors from the relay server implementation
     *
     * Inherits from \class std::runtime_error. The error records the source file, the line number,
     * a description and, if available, the system error number. Errors are used for configuration
     * and programming faults. Faults of a running relay (missing objects, upstream failures etc.)
     * are carried as values, see RelayFault.
     */
    class Error : public std::runtime_error {
    protected:
        int line;            //!< Linenumber where the exception has been thrown
        std::string file;    //!< Name of source code file where the exception has been thrown
        std::string message; //!< Description of the problem
        int sysErrno;        //!< If there is a system error number

    public:

        Error(const char *file, int line, const char *msg, int errno_p = 0);

        Error(const char *file, int line, const std::string &msg, int errno_p = 0);

        [[nodiscard]] inline int getLine() const { return line; }

        [[maybe_unused]] [[nodiscard]] inline std::string getFile() const { return file; }

        [[nodiscard]] inline std::string getMessage() const { return message; }

        [[nodiscard]] inline int getSysErrno() const { return sysErrno; }

        /*!
         * Returns the error as a single line in the form
         * "Error at [file: line] (system error: ...): message"
         */
        [[nodiscard]] virtual std::string to_string() const;

        inline explicit operator std::string() const {
            return to_string();
        }

        friend std::ostream &operator<<(std::ostream &outStream, const Error &rhs);
    };
}

#endif //BAMRELAY_ERROR_H
