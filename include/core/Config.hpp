#pragma once

#include <cstddef>
#include <string>

#include "Types.hpp"

namespace PolyScan {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Validated by both CLI11 (basic checks) and the validate() method
 * (nucleotide alphabet, percentage range, input readability).
 */
struct Config {
    // Input/Output
    std::string fasta_path;          ///< Path to input FASTA, plain or gzip/BGZF compressed (Required)
    std::string output_path = "-";   ///< BED output path, "-" for stdout

    // Scan Parameters
    std::size_t window_size = 10;    ///< Length of the sliding window (bp)
    double percentage = 80.0;        ///< Required percentage of the nucleotide in a window
    std::string nucleotide = "A";    ///< Nucleotide to search for (A, C, G, T or N); complement is implied

    // Logging
    LogLevel log_level = LogLevel::LOG_WARN;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional log file (in addition to stderr)

    static constexpr double kMinPercentage = 50.0;
    static constexpr double kMaxPercentage = 100.0;

    /**
     * @brief Validates configuration logic and input readability.
     *
     * Reports every problem found through the logger, then returns.
     * The FASTA file is opened with htslib to make sure it is readable
     * (compression is detected the same way the scanner will).
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Logs the current configuration at info level.
     */
    void print() const;

    /**
     * @brief Check if debug mode is enabled.
     */
    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace PolyScan
