#include "core/ScanParameters.hpp"

#include <cmath>
#include <stdexcept>

namespace PolyScan {

std::size_t ScanParameters::compute_threshold(std::size_t window_size, double percentage) {
    double raw = std::ceil((percentage / 100.0) * static_cast<double>(window_size));
    if (!(raw > 0.0)) {
        return 0;
    }
    // Above 100%: no window can reach it, and the cast would overflow
    if (raw > static_cast<double>(window_size)) {
        return window_size + 1;
    }
    return static_cast<std::size_t>(raw);
}

ScanParameters ScanParameters::resolve(std::size_t window_size, double percentage, char nucleotide) {
    Nucleotide target;
    if (!classify_base(nucleotide, target)) {
        throw std::invalid_argument(std::string("Nucleotide must be one of A, C, G, T or N, got '") + nucleotide +
                                    "'");
    }

    ScanParameters params;
    params.window_size = window_size;
    params.threshold_count = compute_threshold(window_size, percentage);
    params.target = target;
    params.complement = complement_of(target);
    params.percentage = percentage;
    return params;
}

ScanParameters ScanParameters::resolve(std::size_t window_size, double percentage, const std::string& nucleotide) {
    if (nucleotide.size() != 1) {
        throw std::invalid_argument("Nucleotide must be a single character (A, C, G, T, or N), got \"" +
                                    nucleotide + "\"");
    }
    return resolve(window_size, percentage, nucleotide[0]);
}

}  // namespace PolyScan
