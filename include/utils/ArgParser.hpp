#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

#include "core/Config.hpp"

#define POLYSCAN_VERSION "0.1.0"

namespace PolyScan {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (file existence, numeric ranges). Nucleotide alphabet checks are left to
     * Config::validate().
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help/version was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        int exit_code = 0;
        return parse(argc, argv, config, exit_code);
    }

    /**
     * @brief Same as above, also reporting the exit code CLI11 chose
     * (0 for --help/--version, non-zero for errors).
     */
    static bool parse(int argc, char** argv, Config& config, int& exit_code) {
        CLI::App app{"polyscan - Find windows in DNA sequences that have >= threshold% of a nucleotide. "
                     "Outputs 6-column BED."};
        app.set_version_flag("-V,--version", std::string("polyscan ") + POLYSCAN_VERSION);

        // Input/Output
        app.add_option("-f,--fasta", config.fasta_path, "Path to input FASTA file, optionally gzip/BGZF compressed (Required)")
            ->required();

        app.add_option("-o,--output", config.output_path, "Output BED path, '-' for stdout (Default: -)");

        // Scan parameters
        app.add_option("-w,--window-size", config.window_size, "Length of the sliding window (Default: 10)")
            ->check(CLI::PositiveNumber);

        app.add_option("-p,--percentage", config.percentage,
                       "Percentage of target nucleotide required in the window (Default: 80.0)")
            ->check(CLI::Range(Config::kMinPercentage, Config::kMaxPercentage));

        app.add_option("-n,--nucleotide", config.nucleotide,
                       "Nucleotide base to search for (A, C, G, T or N); its complement is handled automatically (Default: A)");

        // Logging
        std::string log_level_str = "warn";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: warn)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also append log lines to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help/version requested (ret=0) or error occurred (ret>0)
            exit_code = app.exit(e);
            return false;
        }

        // Convert log level string to enum
        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        std::string log_lower = log_level_str;
        std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(), ::tolower);
        auto it = log_level_map.find(log_lower);
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        exit_code = 0;
        return true;
    }
};

} // namespace Utils
} // namespace PolyScan
