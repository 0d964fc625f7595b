#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/FrequencyTable.hpp"
#include "core/ScanParameters.hpp"

namespace PolyScan {

/**
 * @brief Fixed-length window sliding one base at a time over a sequence.
 *
 * The table is primed once from [0, window_size) and afterwards updated in
 * O(1) per step: the byte at start-1 leaves, the byte at start+window_size-1
 * enters. The sequence must outlive the window.
 *
 * Usage:
 *   SlidingWindow win(seq, 10);
 *   for (bool ok = win.valid(); ok; ok = win.advance()) {
 *       use(win.start(), win.table());
 *   }
 */
class SlidingWindow {
public:
    SlidingWindow(const std::string& sequence, std::size_t window_size);

    /// False when window_size is 0 or longer than the sequence.
    bool valid() const { return valid_; }

    /**
     * @brief Move one base to the right.
     * @return false (and leaves the state unchanged) once the last window is reached.
     */
    bool advance();

    std::size_t start() const { return start_; }
    std::size_t end() const { return start_ + window_size_; }
    std::size_t window_size() const { return window_size_; }
    const FrequencyTable& table() const { return table_; }

private:
    const std::string& sequence_;
    std::size_t window_size_;
    std::size_t start_;
    std::size_t last_start_;
    bool valid_;
    FrequencyTable table_;
};

/// Receives matches one at a time, in emission order.
using MatchSink = std::function<void(const IntervalMatch&)>;

/**
 * @brief Finds every window whose target (+) or complement (-) count reaches
 * the threshold.
 *
 * For each window, the + check runs before the - check and both run
 * independently, so a window yields zero, one or two matches. Both matches
 * carry the user's nucleotide as symbol. With N as target the two checks read
 * the same slot and a passing window is reported on both strands.
 *
 * Sequences shorter than the window, and a window size of 0, yield nothing.
 * No state is kept between calls.
 */
class WindowScanner {
public:
    explicit WindowScanner(const ScanParameters& params);

    /**
     * @brief Scan one record, handing each match to the sink.
     * @return Number of matches emitted.
     */
    std::size_t scan(const std::string& seq_id, const std::string& sequence, const MatchSink& sink) const;

    /**
     * @brief Scan one record and collect the matches.
     */
    std::vector<IntervalMatch> scan(const std::string& seq_id, const std::string& sequence) const;

private:
    std::size_t evaluate(const std::string& seq_id, const SlidingWindow& window, const MatchSink& sink) const;

    ScanParameters params_;
};

}  // namespace PolyScan
