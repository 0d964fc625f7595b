#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "Types.hpp"

namespace PolyScan {

/**
 * @brief Per-nucleotide counts over the current window.
 *
 * Unrecognized bytes are never counted, so total() plus the number of
 * unrecognized bytes in the window equals the window size.
 */
class FrequencyTable {
public:
    FrequencyTable() { counts_.fill(0); }

    /**
     * @brief Count every byte of [first, last) from scratch.
     */
    static FrequencyTable from_range(const char* first, const char* last) {
        FrequencyTable table;
        for (const char* p = first; p != last; ++p) {
            table.add(*p);
        }
        return table;
    }

    void add(char base) {
        Nucleotide n;
        if (classify_base(base, n)) {
            ++counts_[static_cast<std::size_t>(n)];
        }
    }

    /// Saturates at zero.
    void remove(char base) {
        Nucleotide n;
        if (classify_base(base, n)) {
            std::size_t& slot = counts_[static_cast<std::size_t>(n)];
            if (slot > 0) {
                --slot;
            }
        }
    }

    std::size_t count(Nucleotide n) const { return counts_[static_cast<std::size_t>(n)]; }

    std::size_t total() const {
        std::size_t sum = 0;
        for (std::size_t c : counts_) {
            sum += c;
        }
        return sum;
    }

    bool operator==(const FrequencyTable& other) const { return counts_ == other.counts_; }
    bool operator!=(const FrequencyTable& other) const { return !(*this == other); }

    /// "A=3 C=0 G=1 T=6 N=0", for debug logs and test failure messages.
    std::string to_string() const {
        std::string out;
        for (std::size_t i = 0; i < kNumNucleotides; ++i) {
            if (i > 0) out += ' ';
            out += nucleotide_to_char(static_cast<Nucleotide>(i));
            out += '=';
            out += std::to_string(counts_[i]);
        }
        return out;
    }

private:
    std::array<std::size_t, kNumNucleotides> counts_;
};

}  // namespace PolyScan
