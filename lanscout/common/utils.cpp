/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file utils.cpp
 * @brief Utilities for liblanscout
 **/

#include "common/utils.hpp"

#include <sstream>

namespace lanscout
{

std::string StringUtils::to_hex_string(const uint8_t *array, size_t size, bool uppercase, const std::string &delimiter)
{
    std::stringstream stream;
    for (size_t i = 0; i < size; i++) {
        const auto hex_byte = uppercase ? fmt::format("{:02X}", array[i]) : fmt::format("{:02x}", array[i]);
        stream << hex_byte;
        if (i != (size - 1)) {
            stream << delimiter;
        }
    }
    return stream.str();
}

std::vector<std::string> StringUtils::split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(str);
    while (std::getline(stream, token, delimiter)) {
        tokens.push_back(token);
    }
    if (!str.empty() && (str.back() == delimiter)) {
        tokens.emplace_back();
    }
    return tokens;
}

} /* namespace lanscout */
