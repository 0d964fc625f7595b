#include "core/Config.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"

namespace PolyScan {

bool Config::validate() const {
    bool valid = true;

    if (fasta_path.empty()) {
        LOG_ERROR("FASTA path is required.");
        valid = false;
    } else if (fasta_path != "-") {
        // Opens, checks the compression and reads up to the first header
        try {
            FastaReader reader(fasta_path);
        } catch (const std::runtime_error& e) {
            LOG_ERROR(std::string("Cannot read FASTA file: ") + e.what());
            valid = false;
        }
    }

    if (window_size == 0) {
        LOG_ERROR("window_size must be positive.");
        valid = false;
    }

    if (!(percentage >= kMinPercentage && percentage <= kMaxPercentage)) {
        LOG_ERROR("percentage must be between 50.0 and 100.0");
        valid = false;
    }

    if (nucleotide.size() != 1) {
        LOG_ERROR("nucleotide must be a single character (A, C, G, T, or N).");
        valid = false;
    } else {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(nucleotide[0])));
        if (c != 'A' && c != 'C' && c != 'G' && c != 'T' && c != 'N') {
            LOG_ERROR("nucleotide must be one of A, C, G, T, or N.");
            valid = false;
        }
    }

    return valid;
}

void Config::print() const {
    std::stringstream ss;
    ss << "--- Configuration ---\n"
       << "FASTA: " << fasta_path << "\n"
       << "Output: " << (output_path == "-" ? "stdout" : output_path) << "\n"
       << "Window Size: " << window_size << " bp\n"
       << "Percentage: " << percentage << "\n"
       << "Nucleotide: " << nucleotide << "\n"
       << "---------------------";
    LOG_INFO(ss.str());
}

}  // namespace PolyScan
