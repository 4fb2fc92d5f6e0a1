/**
 * @file cli_utils.h
 * @brief Common utility functions for shacore CLI commands
 *
 * @author shacore Development Team
 * @date 2026-10-19
 */

#ifndef SHACORE_CLI_UTILS_H
#define SHACORE_CLI_UTILS_H

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace shacore {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline std::vector<unsigned char> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return std::vector<unsigned char>(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Read all of a stream (e.g. std::cin) into a byte vector
 */
inline std::vector<unsigned char> read_stream(std::istream& in) {
    std::vector<unsigned char> data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    if (in.bad()) {
        throw std::runtime_error("Failed to read input stream");
    }
    return data;
}

/**
 * @brief Lowercase a command-line token
 */
inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace cli
} // namespace shacore

#endif // SHACORE_CLI_UTILS_H
