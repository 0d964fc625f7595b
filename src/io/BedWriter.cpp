#include "io/BedWriter.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace PolyScan {

BedWriter::BedWriter(const std::string& output_path)
    : out_(nullptr), path_(output_path), lines_written_(0) {
    if (output_path == "-") {
        out_ = &std::cout;
        return;
    }

    file_.open(output_path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open output BED file: " + output_path);
    }
    out_ = &file_;
}

BedWriter::BedWriter(std::ostream& out) : out_(&out), path_("<stream>"), lines_written_(0) {
}

uint64_t BedWriter::score_for(double percentage) {
    double rounded = std::ceil(percentage);
    if (!(rounded > 0.0)) {
        return 0;
    }
    return static_cast<uint64_t>(rounded);
}

std::string BedWriter::format(const IntervalMatch& match) {
    std::ostringstream ss;
    ss << match.seq_id << '\t'
       << match.start << '\t'
       << match.end << '\t'
       << nucleotide_to_char(match.symbol) << '\t'
       << score_for(match.percentage) << '\t'
       << strand_to_string(match.strand);
    return ss.str();
}

void BedWriter::write(const IntervalMatch& match) {
    *out_ << format(match) << '\n';
    if (!*out_) {
        throw std::runtime_error("Failed to write BED record to " + path_);
    }
    ++lines_written_;
}

void BedWriter::flush() {
    out_->flush();
    if (!*out_) {
        throw std::runtime_error("Failed to flush BED output " + path_);
    }
}

}  // namespace PolyScan
