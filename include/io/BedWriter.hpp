#pragma once

#include <cstdint>
#include <fstream>
#include <ostream>
#include <string>

#include "core/DataStructs.hpp"

namespace PolyScan {

/**
 * @brief Writes interval matches as 6-column BED.
 *
 * One tab-separated line per match, in arrival order:
 * ```
 * chrom  start  end  name  score  strand
 * chr1   0      10   A     100    +
 * ```
 * - start/end: 0-based, half-open
 * - name: the user's nucleotide (also on "-" lines)
 * - score: percentage rounded up to an integer
 */
class BedWriter {
public:
    /**
     * @brief Write to a file, or to stdout when path is "-".
     * @throws std::runtime_error if the file cannot be created.
     */
    explicit BedWriter(const std::string& output_path);

    /**
     * @brief Write to an existing stream (not owned).
     */
    explicit BedWriter(std::ostream& out);

    BedWriter(const BedWriter&) = delete;
    BedWriter& operator=(const BedWriter&) = delete;

    /**
     * @brief Append one record.
     * @throws std::runtime_error if the stream fails.
     */
    void write(const IntervalMatch& match);

    /**
     * @brief Flush buffered output.
     * @throws std::runtime_error if the stream fails.
     */
    void flush();

    uint64_t lines_written() const { return lines_written_; }

    /**
     * @brief BED score for a percentage: ceil(percentage).
     */
    static uint64_t score_for(double percentage);

    /**
     * @brief Format one match without the trailing newline.
     */
    static std::string format(const IntervalMatch& match);

private:
    std::ofstream file_;
    std::ostream* out_;
    std::string path_;
    uint64_t lines_written_;
};

}  // namespace PolyScan
