/**
 * @file cmd_crack.cpp
 * @brief Dictionary attack subcommand for shacore CLI
 *
 * Usage:
 *   shacore crack -target <sha256-hex> -wordlist words.txt
 *
 * @author shacore Development Team
 * @date 2026-10-19
 */

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "shacore/advanced/dictionary_attack.hpp"

/**
 * @brief Print crack subcommand help
 */
void print_crack_help() {
    std::cout << "\nUsage: shacore crack [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -target <hex>      Unsalted SHA-256 password digest, 64 hex chars (required)\n";
    std::cout << "  -wordlist <file>   Candidate passwords, one per line (required)\n";
    std::cout << "  -v, --verbose      Print the number of candidates tried to stderr\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Exit status: 0 if found, 2 if not found, 1 on error.\n\n";
}

/**
 * @brief Crack subcommand handler
 */
int cmd_crack(int argc, char* argv[]) {
    std::string target_hex, wordlist_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-target" && i + 1 < argc) {
            target_hex = argv[++i];
        } else if (arg == "-wordlist" && i + 1 < argc) {
            wordlist_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_crack_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_crack_help();
            return 1;
        }
    }

    if (target_hex.empty() || wordlist_file.empty()) {
        std::cerr << "Error: Missing required arguments (-target, -wordlist)\n";
        print_crack_help();
        return 1;
    }

    try {
        shacore::advanced::DictionaryAttack attack(target_hex);

        std::ifstream wordlist(wordlist_file);
        if (!wordlist.is_open()) {
            std::cerr << "Error: Failed to open wordlist: " << wordlist_file << "\n";
            return 1;
        }

        const std::optional<std::string> found = attack.run(wordlist);
        if (verbose) {
            std::cerr << "Candidates tried: " << attack.attempts() << "\n";
        }

        if (!found) {
            std::cout << "Password not found in " << wordlist_file << "\n";
            return 2;
        }
        std::cout << "Password found: " << *found << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
