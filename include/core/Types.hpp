#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace PolyScan {

/**
 * @brief The five recognized nucleotide classes.
 *
 * Values double as slot indices into a FrequencyTable.
 */
enum class Nucleotide : uint8_t {
    A = 0,
    C = 1,
    G = 2,
    T = 3,
    N = 4
};

constexpr std::size_t kNumNucleotides = 5;

/**
 * @brief Strand on which a window passed the threshold.
 *
 * - FORWARD: the chosen nucleotide itself reached the threshold (+)
 * - REVERSE: its complement reached the threshold (-)
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< Forward strand (+)
    REVERSE = 1   ///< Reverse strand (-)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output including per-record stats
};

/**
 * @brief Byte-to-nucleotide lookup, case-insensitive.
 *
 * Anything outside A/C/G/T/N (either case) maps to kUnrecognized.
 */
constexpr uint8_t kUnrecognized = 0xFF;

inline const std::array<uint8_t, 256>& nucleotide_lookup() {
    static const std::array<uint8_t, 256> table = [] {
        std::array<uint8_t, 256> t{};
        t.fill(kUnrecognized);
        t['A'] = t['a'] = static_cast<uint8_t>(Nucleotide::A);
        t['C'] = t['c'] = static_cast<uint8_t>(Nucleotide::C);
        t['G'] = t['g'] = static_cast<uint8_t>(Nucleotide::G);
        t['T'] = t['t'] = static_cast<uint8_t>(Nucleotide::T);
        t['N'] = t['n'] = static_cast<uint8_t>(Nucleotide::N);
        return t;
    }();
    return table;
}

/**
 * @brief Classify one sequence byte.
 * @param out Set to the nucleotide when the byte is recognized.
 * @return false for unrecognized bytes.
 */
inline bool classify_base(char c, Nucleotide& out) {
    uint8_t idx = nucleotide_lookup()[static_cast<unsigned char>(c)];
    if (idx == kUnrecognized) {
        return false;
    }
    out = static_cast<Nucleotide>(idx);
    return true;
}

/**
 * @brief Watson-Crick complement; N is its own complement.
 */
inline Nucleotide complement_of(Nucleotide n) {
    switch (n) {
        case Nucleotide::A: return Nucleotide::T;
        case Nucleotide::T: return Nucleotide::A;
        case Nucleotide::C: return Nucleotide::G;
        case Nucleotide::G: return Nucleotide::C;
        case Nucleotide::N: return Nucleotide::N;
    }
    return Nucleotide::N;
}

inline char nucleotide_to_char(Nucleotide n) {
    static const char kChars[kNumNucleotides] = {'A', 'C', 'G', 'T', 'N'};
    return kChars[static_cast<std::size_t>(n)];
}

inline std::string strand_to_string(Strand s) {
    return s == Strand::FORWARD ? "+" : "-";
}

}  // namespace PolyScan
