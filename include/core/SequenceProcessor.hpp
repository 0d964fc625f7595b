#pragma once

#include <cstdint>
#include <string>

#include "core/Config.hpp"
#include "core/ScanParameters.hpp"
#include "core/WindowScanner.hpp"
#include "io/BedWriter.hpp"
#include "utils/FastaReader.hpp"

namespace PolyScan {

/**
 * @brief Totals for one run.
 */
struct ScanSummary {
    uint64_t num_records;          ///< FASTA records read
    uint64_t num_short_records;    ///< Records shorter than the window (skipped)
    uint64_t num_bases;            ///< Total bases across all records
    uint64_t num_windows;          ///< Window positions evaluated
    uint64_t num_forward_matches;  ///< "+" lines written
    uint64_t num_reverse_matches;  ///< "-" lines written
    double elapsed_ms;

    ScanSummary()
        : num_records(0),
          num_short_records(0),
          num_bases(0),
          num_windows(0),
          num_forward_matches(0),
          num_reverse_matches(0),
          elapsed_ms(0.0) {
    }

    uint64_t num_matches() const { return num_forward_matches + num_reverse_matches; }
};

/**
 * @brief Drives a whole run: FASTA records in, BED lines out.
 *
 * Parameters are resolved once in the constructor. Records are then
 * scanned one after another, strictly in file order, and every match is
 * written as soon as it is produced.
 */
class SequenceProcessor {
public:
    /**
     * @param config Validated configuration.
     * @throws std::invalid_argument if the nucleotide cannot be resolved.
     */
    explicit SequenceProcessor(const Config& config);

    /**
     * @brief Scan every record of the configured FASTA into the writer.
     * @throws std::runtime_error on FASTA read or BED write errors.
     */
    ScanSummary process_all(BedWriter& writer);

    /**
     * @brief Scan every record read from `reader` into the writer.
     */
    ScanSummary process_all(FastaReader& reader, BedWriter& writer);

    /**
     * @brief Scan a single record into the writer, updating `summary`.
     */
    void process_record(const SequenceRecord& record, BedWriter& writer, ScanSummary& summary);

    const ScanParameters& params() const { return params_; }

    /**
     * @brief Logs the processing summary at info level.
     */
    void print_summary(const ScanSummary& summary) const;

private:
    std::string fasta_path_;
    ScanParameters params_;
    WindowScanner scanner_;
};

}  // namespace PolyScan
