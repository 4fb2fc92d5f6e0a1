/**
 * @file cmd_hash.cpp
 * @brief Hash subcommand implementation for shacore CLI
 *
 * Usage:
 *   shacore hash -in file.txt
 *   shacore hash -string abc
 *   cat data.bin | shacore hash -binary > digest.bin
 *
 * @author shacore Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <string>
#include <vector>

#include "shacore/crypto/hash/sha256.hpp"
#include "shacore/utils/encoding.h"
#include "cli_utils.h"

using shacore::cli::read_file;
using shacore::cli::read_stream;

/**
 * @brief Print hash subcommand help
 */
void print_hash_help() {
    std::cout << "\nUsage: shacore hash [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>         Input file path\n";
    std::cout << "  -string <text>     Hash the given text instead of a file\n";
    std::cout << "  -hex               Output in hexadecimal (default)\n";
    std::cout << "  -binary            Output raw 32-byte digest\n";
    std::cout << "  -v, --verbose      Print input size and block count to stderr\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Without -in or -string the message is read from stdin.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  shacore hash -in document.pdf\n";
    std::cout << "  shacore hash -string abc\n\n";
}

/**
 * @brief Hash subcommand handler
 */
int cmd_hash(int argc, char* argv[]) {
    std::string input_file, input_text;
    bool have_text = false;
    bool hex_output = true;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-string" && i + 1 < argc) {
            input_text = argv[++i];
            have_text = true;
        } else if (arg == "-hex") {
            hex_output = true;
        } else if (arg == "-binary") {
            hex_output = false;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_hash_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_hash_help();
            return 1;
        }
    }

    if (have_text && !input_file.empty()) {
        std::cerr << "Error: -in and -string are mutually exclusive\n";
        return 1;
    }

    try {
        std::vector<unsigned char> message;
        std::string label;
        if (have_text) {
            message.assign(input_text.begin(), input_text.end());
            label = "\"" + input_text + "\"";
        } else if (!input_file.empty()) {
            message = read_file(input_file);
            label = input_file;
        } else {
            message = read_stream(std::cin);
            label = "stdin";
        }

        if (verbose) {
            std::cerr << "Input: " << label << " (" << message.size() << " bytes, "
                      << shacore::sha256::padded_length(message.size()) /
                             shacore::sha256::kBlockSize
                      << " blocks)\n";
        }

        const shacore::sha256::Digest d = shacore::sha256::digest(message);

        if (hex_output) {
            std::cout << "SHA-256(" << label << ")= "
                      << shacore::encoding::hexEncode(d.data(), d.size()) << "\n";
        } else {
            std::cout.write(reinterpret_cast<const char*>(d.data()),
                            static_cast<std::streamsize>(d.size()));
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
