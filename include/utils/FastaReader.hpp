#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/DataStructs.hpp"

namespace PolyScan {

/**
 * @brief RAII streaming FASTA reader built on HTSlib.
 *
 * The file is opened through BGZF, which detects plain text, gzip and
 * BGZF input on its own; "-" reads standard input. Other compression
 * (bzip2, xz, zstd), FASTQ, and text before the first '>' are rejected. Records are parsed
 * with HTSlib's kseq and returned one at a time, in file order, so only
 * the current record is held in memory.
 *
 * Usage:
 *   FastaReader fasta("genome.fa.gz");
 *   SequenceRecord rec;
 *   while (fasta.next(rec)) { ... }
 */
class FastaReader {
public:
    /**
     * @brief Opens the FASTA file for sequential reading.
     * @param fasta_path Path to the FASTA file, or "-" for stdin.
     * @throws std::runtime_error if the file cannot be opened, uses an
     *         unsupported compression, or does not start with a '>' header.
     */
    explicit FastaReader(const std::string& fasta_path);

    /**
     * @brief Destructor - releases kseq and BGZF resources.
     */
    ~FastaReader();

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    /**
     * @brief Reads the next record.
     *
     * @param record Filled with the identifier (header up to the first
     *               whitespace) and the residues with line breaks removed.
     *               Case is preserved.
     * @return true if a record was read, false at end of input.
     * @throws std::runtime_error if the stream is truncated or unreadable,
     *         or the record is FASTQ.
     */
    bool next(SequenceRecord& record);

    /**
     * @brief Number of records returned so far.
     */
    uint64_t records_read() const { return records_read_; }

    /**
     * @brief Checks if the file is open.
     */
    bool is_open() const { return impl_ != nullptr; }

    /**
     * @brief Gets the path of the opened FASTA file.
     */
    const std::string& get_path() const { return fasta_path_; }

private:
    struct Impl;

    std::string fasta_path_;
    std::unique_ptr<Impl> impl_;
    uint64_t records_read_;
};

} // namespace PolyScan
