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
#ifndef BAMRELAY_GLOBAL_H
#define BAMRELAY_GLOBAL_H

#include <string>
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>

namespace bamrelay {

    inline std::vector<std::string> split(const std::string &str, char delim) {
        std::stringstream test{str};
        std::string segment;
        std::vector<std::string> seglist;
        while(std::getline(test, segment, delim)) {
            seglist.push_back(segment);
        }
        return seglist;
    }

    inline std::string strtoupper(const std::string &str) {
        std::string lstr{str};
        std::transform(lstr.begin(), lstr.end(), lstr.begin(), ::toupper);
        return lstr;
    }

    inline void asciitolower(std::string &str) { std::transform(str.begin(), str.end(), str.begin(), ::tolower); }

    inline std::string trim_copy(const std::string &s) {
        auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
        auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
        return (first < last) ? std::string(first, last) : std::string();
    }

}

#endif //BAMRELAY_GLOBAL_H
