#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "io/BedWriter.hpp"

using namespace PolyScan;

namespace {

IntervalMatch make_match(const std::string& id, uint64_t start, uint64_t end, Nucleotide symbol, double pct,
                         Strand strand) {
    IntervalMatch m;
    m.seq_id = id;
    m.start = start;
    m.end = end;
    m.symbol = symbol;
    m.percentage = pct;
    m.strand = strand;
    return m;
}

}  // namespace

TEST(BedWriterTest, FormatsSixTabSeparatedColumns) {
    auto m = make_match("chr1", 0, 10, Nucleotide::A, 100.0, Strand::FORWARD);
    EXPECT_EQ(BedWriter::format(m), "chr1\t0\t10\tA\t100\t+");
}

TEST(BedWriterTest, ReverseLineKeepsUserSymbol) {
    auto m = make_match("contig_7", 42, 52, Nucleotide::A, 90.0, Strand::REVERSE);
    EXPECT_EQ(BedWriter::format(m), "contig_7\t42\t52\tA\t90\t-");
}

TEST(BedWriterTest, ScoreIsPercentageRoundedUp) {
    EXPECT_EQ(BedWriter::score_for(100.0), 100u);
    EXPECT_EQ(BedWriter::score_for(80.0), 80u);
    EXPECT_EQ(BedWriter::score_for(87.5), 88u);
    EXPECT_EQ(BedWriter::score_for(66.66666666666667), 67u);
    EXPECT_EQ(BedWriter::score_for(50.0001), 51u);
}

TEST(BedWriterTest, WritesLinesInArrivalOrder) {
    std::ostringstream out;
    BedWriter writer(out);
    writer.write(make_match("s", 0, 10, Nucleotide::N, 100.0, Strand::FORWARD));
    writer.write(make_match("s", 0, 10, Nucleotide::N, 100.0, Strand::REVERSE));
    writer.write(make_match("s", 1, 11, Nucleotide::N, 90.0, Strand::FORWARD));
    writer.flush();

    EXPECT_EQ(out.str(),
              "s\t0\t10\tN\t100\t+\n"
              "s\t0\t10\tN\t100\t-\n"
              "s\t1\t11\tN\t90\t+\n");
    EXPECT_EQ(writer.lines_written(), 3u);
}

TEST(BedWriterTest, WritesToFile) {
    auto path = (std::filesystem::temp_directory_path() / "polyscan_bed_writer_test.bed").string();
    {
        BedWriter writer(path);
        writer.write(make_match("chrX", 5, 15, Nucleotide::G, 80.0, Strand::FORWARD));
        writer.flush();
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_EQ(line, "chrX\t5\t15\tG\t80\t+");
    EXPECT_FALSE(static_cast<bool>(std::getline(in, line)));

    std::remove(path.c_str());
}

TEST(BedWriterTest, UnwritablePathThrows) {
    EXPECT_THROW(BedWriter("/nonexistent_polyscan_dir/out.bed"), std::runtime_error);
}

TEST(BedWriterTest, FailedStreamThrows) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    BedWriter writer(out);
    EXPECT_THROW(writer.write(make_match("s", 0, 1, Nucleotide::A, 100.0, Strand::FORWARD)), std::runtime_error);
    EXPECT_EQ(writer.lines_written(), 0u);
}
