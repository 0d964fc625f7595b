#include "core/WindowScanner.hpp"

namespace PolyScan {

SlidingWindow::SlidingWindow(const std::string& sequence, std::size_t window_size)
    : sequence_(sequence),
      window_size_(window_size),
      start_(0),
      last_start_(0),
      valid_(false) {
    if (window_size_ == 0 || sequence_.size() < window_size_) {
        return;
    }
    last_start_ = sequence_.size() - window_size_;
    const char* data = sequence_.data();
    table_ = FrequencyTable::from_range(data, data + window_size_);
    valid_ = true;
}

bool SlidingWindow::advance() {
    if (!valid_ || start_ >= last_start_) {
        return false;
    }
    ++start_;
    table_.remove(sequence_[start_ - 1]);
    table_.add(sequence_[start_ + window_size_ - 1]);
    return true;
}

WindowScanner::WindowScanner(const ScanParameters& params) : params_(params) {
}

std::size_t WindowScanner::evaluate(const std::string& seq_id, const SlidingWindow& window,
                                    const MatchSink& sink) const {
    std::size_t emitted = 0;
    const double w = static_cast<double>(params_.window_size);
    const std::size_t user_count = window.table().count(params_.target);
    const std::size_t comp_count = window.table().count(params_.complement);
    if (user_count < params_.threshold_count && comp_count < params_.threshold_count) {
        return 0;
    }

    IntervalMatch match;
    match.seq_id = seq_id;
    match.start = window.start();
    match.end = window.end();
    match.symbol = params_.target;

    if (user_count >= params_.threshold_count) {
        match.percentage = (static_cast<double>(user_count) / w) * 100.0;
        match.strand = Strand::FORWARD;
        sink(match);
        ++emitted;
    }

    // Reported with the user's symbol, not the complement.
    if (comp_count >= params_.threshold_count) {
        match.percentage = (static_cast<double>(comp_count) / w) * 100.0;
        match.strand = Strand::REVERSE;
        sink(match);
        ++emitted;
    }

    return emitted;
}

std::size_t WindowScanner::scan(const std::string& seq_id, const std::string& sequence,
                                const MatchSink& sink) const {
    SlidingWindow window(sequence, params_.window_size);
    if (!window.valid()) {
        return 0;
    }

    std::size_t emitted = evaluate(seq_id, window, sink);
    while (window.advance()) {
        emitted += evaluate(seq_id, window, sink);
    }
    return emitted;
}

std::vector<IntervalMatch> WindowScanner::scan(const std::string& seq_id, const std::string& sequence) const {
    std::vector<IntervalMatch> matches;
    scan(seq_id, sequence, [&matches](const IntervalMatch& m) { matches.push_back(m); });
    return matches;
}

}  // namespace PolyScan
