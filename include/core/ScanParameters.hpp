#pragma once

#include <cstddef>
#include <string>

#include "Types.hpp"

namespace PolyScan {

/**
 * @brief Fixed scan parameters, resolved once per run.
 *
 * Usage:
 *   ScanParameters params = ScanParameters::resolve(10, 80.0, 'a');
 *   // params.threshold_count == 8, target == A, complement == T
 */
struct ScanParameters {
    std::size_t window_size;      ///< Window length in bases (0 = no windows)
    std::size_t threshold_count;  ///< Minimum count for a pass
    Nucleotide target;            ///< Nucleotide chosen by the user
    Nucleotide complement;        ///< complement_of(target)
    double percentage;            ///< Percentage the threshold was derived from

    /**
     * @brief Build parameters from validated user inputs.
     *
     * threshold_count = ceil(percentage / 100 * window_size). Fractional
     * thresholds always round up.
     *
     * @param window_size Window length in bases.
     * @param percentage Required percentage, normally in [50, 100].
     * @param nucleotide One of A/C/G/T/N, either case.
     * @throws std::invalid_argument for any other nucleotide character.
     */
    static ScanParameters resolve(std::size_t window_size, double percentage, char nucleotide);

    /// Same as above but takes the selector as text; it must be exactly one character.
    static ScanParameters resolve(std::size_t window_size, double percentage, const std::string& nucleotide);

    /**
     * @brief ceil(percentage / 100 * window_size), evaluated in that order.
     */
    static std::size_t compute_threshold(std::size_t window_size, double percentage);
};

}  // namespace PolyScan
