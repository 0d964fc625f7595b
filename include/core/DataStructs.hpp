#pragma once

#include <cstdint>
#include <string>

#include "Types.hpp"

namespace PolyScan {

/**
 * @brief One decoded FASTA record.
 */
struct SequenceRecord {
    std::string id;        ///< Header text up to the first whitespace
    std::string sequence;  ///< Residues, case preserved, line breaks removed
};

/**
 * @brief A window that passed the threshold on one strand.
 *
 * `symbol` is always the nucleotide the user asked for. A REVERSE match passed
 * on the complement's count but still carries the user's symbol; the strand
 * column is what tells the two apart.
 */
struct IntervalMatch {
    std::string seq_id;   ///< Sequence identifier (BED chrom)
    uint64_t start;       ///< Window start (0-based, inclusive)
    uint64_t end;         ///< Window end (0-based, exclusive)
    Nucleotide symbol;    ///< User-chosen nucleotide
    double percentage;    ///< Observed count / window size * 100
    Strand strand;        ///< FORWARD (+) or REVERSE (-)

    IntervalMatch()
        : start(0),
          end(0),
          symbol(Nucleotide::A),
          percentage(0.0),
          strand(Strand::FORWARD) {
    }
};

}  // namespace PolyScan
