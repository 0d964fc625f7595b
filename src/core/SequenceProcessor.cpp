#include "core/SequenceProcessor.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include "utils/Logger.hpp"

namespace PolyScan {

SequenceProcessor::SequenceProcessor(const Config& config)
    : fasta_path_(config.fasta_path),
      params_(ScanParameters::resolve(config.window_size, config.percentage, config.nucleotide)),
      scanner_(params_) {
    std::stringstream ss;
    ss << "SequenceProcessor initialized: window_size=" << params_.window_size
       << ", threshold_count=" << params_.threshold_count
       << ", target=" << nucleotide_to_char(params_.target)
       << ", complement=" << nucleotide_to_char(params_.complement);
    LOG_INFO(ss.str());
}

ScanSummary SequenceProcessor::process_all(BedWriter& writer) {
    FastaReader reader(fasta_path_);
    return process_all(reader, writer);
}

ScanSummary SequenceProcessor::process_all(FastaReader& reader, BedWriter& writer) {
    ScanSummary summary;
    LOG_INFO("Scanning " + reader.get_path());
    auto t_start = std::chrono::steady_clock::now();

    SequenceRecord record;
    while (reader.next(record)) {
        process_record(record, writer, summary);
    }
    writer.flush();

    auto t_end = std::chrono::steady_clock::now();
    summary.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    return summary;
}

void SequenceProcessor::process_record(const SequenceRecord& record, BedWriter& writer, ScanSummary& summary) {
    const uint64_t len = record.sequence.size();
    ++summary.num_records;
    summary.num_bases += len;

    if (params_.window_size == 0 || len < params_.window_size) {
        ++summary.num_short_records;
        LOG_DEBUG("Skipping " + record.id + ": length " + std::to_string(len) + " < window size " +
                  std::to_string(params_.window_size));
        return;
    }

    uint64_t forward = 0;
    uint64_t reverse = 0;
    scanner_.scan(record.id, record.sequence, [&](const IntervalMatch& match) {
        writer.write(match);
        if (match.strand == Strand::FORWARD) {
            ++forward;
        } else {
            ++reverse;
        }
    });

    summary.num_windows += len - params_.window_size + 1;
    summary.num_forward_matches += forward;
    summary.num_reverse_matches += reverse;

    if (Utils::Logger::instance().get_log_level() >= LogLevel::LOG_DEBUG) {
        std::stringstream ss;
        ss << record.id << ": " << len << " bp, " << forward << " (+) / " << reverse << " (-) windows";
        LOG_DEBUG(ss.str());
    }
}

void SequenceProcessor::print_summary(const ScanSummary& summary) const {
    std::stringstream ss;
    ss << "\n=== Scan Summary ===\n"
       << "Records: " << summary.num_records << "\n"
       << "  Shorter than window (skipped): " << summary.num_short_records << "\n"
       << "Bases scanned: " << summary.num_bases << "\n"
       << "Windows evaluated: " << summary.num_windows << "\n"
       << "Matches written: " << summary.num_matches() << "\n"
       << "  Forward strand (+): " << summary.num_forward_matches << "\n"
       << "  Reverse strand (-): " << summary.num_reverse_matches << "\n"
       << "Total processing time: " << std::fixed << std::setprecision(1) << summary.elapsed_ms << " ms";
    LOG_INFO(ss.str());
}

}  // namespace PolyScan
