/**
 * @file shacore_main.cpp
 * @brief shacore Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   shacore <command> [options]
 *
 * Commands:
 *   hash         SHA-256 digest of a file, string or stdin
 *   crack        Dictionary attack on an unsalted SHA-256 password digest
 *   constants    Print and verify the generated round constants
 *   version      Display version information
 *   help         Show help message
 *
 * @author shacore Development Team
 * @date 2026-10-19
 * @copyright Apache License 2.0
 */

#include <iostream>
#include <string>

#include "shacore/shacore.h"
#include "cli_utils.h"

// Subcommand handlers (forward declarations)
int cmd_hash(int argc, char* argv[]);
int cmd_crack(int argc, char* argv[]);
int cmd_constants(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: shacore <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  hash         Compute a SHA-256 digest (file, string or stdin)\n";
    std::cout << "  crack        Recover a password from its SHA-256 digest with a wordlist\n";
    std::cout << "  constants    Print and verify the generated SHA-256 constants\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  shacore hash -in file.txt\n";
    std::cout << "  shacore hash -string abc\n";
    std::cout << "  shacore crack -target <hex> -wordlist words.txt\n";
    std::cout << "  shacore constants -init\n\n";
    std::cout << "For command-specific help, use: shacore <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << SHACORE_LIBRARY_NAME << " - " << SHACORE_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << shacore_version() << "\n";
    std::cout << "Release Date: " << SHACORE_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << SHACORE_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << shacore_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP (exact root extraction for constant generation)\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    const std::string command = shacore::cli::to_lower(argv[1]);

    if (command == "hash" || command == "sha256") {
        return cmd_hash(argc - 1, argv + 1);
    }
    else if (command == "crack") {
        return cmd_crack(argc - 1, argv + 1);
    }
    else if (command == "constants") {
        return cmd_constants(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
