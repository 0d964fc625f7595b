#include "utils/FastaReader.hpp"

#include <cctype>
#include <stdexcept>

#include <htslib/bgzf.h>
#include <htslib/hfile.h>
#include <htslib/hts.h>
#include <htslib/kseq.h>

KSEQ_INIT(BGZF*, bgzf_read)

namespace PolyScan {

namespace {

void assign_kstring(std::string& out, const kstring_t& ks) {
    if (ks.s && ks.l > 0) {
        out.assign(ks.s, ks.l);
    } else {
        out.clear();
    }
}

// BGZF only inflates gzip/BGZF; anything else would be parsed as raw bytes.
const char* unsupported_compression(enum htsCompression compression) {
    switch (compression) {
        case bzip2_compression: return "bzip2";
        case xz_compression: return "xz";
        case zstd_compression: return "zstd";
        case custom: return "an unrecognised compression";
        default: return nullptr;
    }
}

// kseq skips anything before the first '>' or '@'. Require a FASTA header as
// the first non-blank byte and hand the '>' back to kseq.
void expect_fasta_header(kseq_t* seq, const std::string& fasta_path) {
    int c;
    while ((c = ks_getc(seq->f)) >= 0 && std::isspace(c)) {
    }
    if (c == -1) {
        return;  // empty input
    }
    if (c < -1) {
        throw std::runtime_error("Error while reading FASTA file " + fasta_path);
    }
    if (c != '>') {
        throw std::runtime_error("Expected '>' at start of FASTA file " + fasta_path + ", found '" +
                                 std::string(1, static_cast<char>(c)) + "'");
    }
    seq->last_char = c;
}

}  // namespace

struct FastaReader::Impl {
    BGZF* fp = nullptr;
    kseq_t* seq = nullptr;

    ~Impl() {
        if (seq) {
            kseq_destroy(seq);
        }
        if (fp) {
            bgzf_close(fp);
        }
    }
};

FastaReader::FastaReader(const std::string& fasta_path)
    : fasta_path_(fasta_path), records_read_(0) {
    std::unique_ptr<Impl> impl(new Impl());

    hFILE* hfp = hopen(fasta_path.c_str(), "r");
    if (!hfp) {
        throw std::runtime_error("Failed to open FASTA file: " + fasta_path);
    }

    htsFormat fmt;
    if (hts_detect_format(hfp, &fmt) < 0) {
        hclose_abruptly(hfp);
        throw std::runtime_error("Failed to detect format of FASTA file: " + fasta_path);
    }
    if (const char* name = unsupported_compression(fmt.compression)) {
        hclose_abruptly(hfp);
        throw std::runtime_error("Unsupported compression (" + std::string(name) + ") for FASTA file: " +
                                 fasta_path + "; decompress it or recompress with gzip/bgzip");
    }

    impl->fp = bgzf_hopen(hfp, "r");
    if (!impl->fp) {
        hclose_abruptly(hfp);
        throw std::runtime_error("Failed to open FASTA file: " + fasta_path);
    }

    impl->seq = kseq_init(impl->fp);
    if (!impl->seq) {
        throw std::runtime_error("Failed to initialise FASTA parser for: " + fasta_path);
    }

    expect_fasta_header(impl->seq, fasta_path);

    impl_ = std::move(impl);
}

FastaReader::~FastaReader() = default;

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      impl_(std::move(other.impl_)),
      records_read_(other.records_read_) {
    other.records_read_ = 0;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        fasta_path_ = std::move(other.fasta_path_);
        impl_ = std::move(other.impl_);
        records_read_ = other.records_read_;
        other.records_read_ = 0;
    }
    return *this;
}

bool FastaReader::next(SequenceRecord& record) {
    if (!impl_) {
        return false;
    }

    // >= 0: sequence length, -1: end of file, < -1: truncated or I/O error
    int ret = kseq_read(impl_->seq);
    if (ret == -1) {
        return false;
    }
    if (ret < -1) {
        throw std::runtime_error("Error while reading FASTA file " + fasta_path_ + " after " +
                                 std::to_string(records_read_) + " records (code " + std::to_string(ret) + ")");
    }

    if (impl_->seq->qual.l > 0) {
        throw std::runtime_error("FASTQ record '" + std::string(impl_->seq->name.s ? impl_->seq->name.s : "") +
                                 "' in " + fasta_path_ + "; expected FASTA input");
    }

    assign_kstring(record.id, impl_->seq->name);
    assign_kstring(record.sequence, impl_->seq->seq);
    ++records_read_;
    return true;
}

} // namespace PolyScan
