#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "core/Config.hpp"
#include "utils/ArgParser.hpp"

using namespace PolyScan;

// Helper to create small FASTA files
void create_fasta_file(const std::string& path) {
    std::ofstream ofs(path);
    ofs << ">chr1\nAAAAAAAAAA\n";
    ofs.close();
}

TEST(ConfigTest, ValidationSuccess) {
    Config config;
    create_fasta_file("config_test.fa");
    config.fasta_path = "config_test.fa";

    EXPECT_TRUE(config.validate());

    config.nucleotide = "n";
    config.percentage = 100.0;
    EXPECT_TRUE(config.validate());

    std::remove("config_test.fa");
}

TEST(ConfigTest, ValidationFailureMissingFile) {
    Config config;
    // FASTA path is required
    EXPECT_FALSE(config.validate());

    config.fasta_path = "does_not_exist.fa";
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationFailureNotFasta) {
    Config config;
    {
        std::ofstream ofs("config_test.fq");
        ofs << "@r\nACGT\n+\nIIII\n";
    }
    config.fasta_path = "config_test.fq";
    EXPECT_FALSE(config.validate());

    {
        std::ofstream ofs("config_test.fa.bz2", std::ios::binary);
        ofs << "BZh91AY&SY";
    }
    config.fasta_path = "config_test.fa.bz2";
    EXPECT_FALSE(config.validate());

    std::remove("config_test.fq");
    std::remove("config_test.fa.bz2");
}

TEST(ConfigTest, ValidationFailureInvalidWindow) {
    Config config;
    create_fasta_file("config_window.fa");
    config.fasta_path = "config_window.fa";
    config.window_size = 0;
    EXPECT_FALSE(config.validate());
    std::remove("config_window.fa");
}

TEST(ConfigTest, ValidationFailurePercentageOutOfRange) {
    Config config;
    create_fasta_file("config_pct.fa");
    config.fasta_path = "config_pct.fa";

    config.percentage = 49.9;
    EXPECT_FALSE(config.validate());

    config.percentage = 100.1;
    EXPECT_FALSE(config.validate());

    config.percentage = 50.0;
    EXPECT_TRUE(config.validate());

    std::remove("config_pct.fa");
}

TEST(ConfigTest, ValidationFailureInvalidNucleotide) {
    Config config;
    create_fasta_file("config_nuc.fa");
    config.fasta_path = "config_nuc.fa";

    config.nucleotide = "X";
    EXPECT_FALSE(config.validate());

    config.nucleotide = "AT";
    EXPECT_FALSE(config.validate());

    config.nucleotide = "";
    EXPECT_FALSE(config.validate());

    std::remove("config_nuc.fa");
}

TEST(ArgParserTest, ParseArgumentsShortOptions) {
    Config config;
    const char* argv[] = {"polyscan", "-f", "in.fa", "-w", "25", "-p", "90.5", "-n", "g", "-o", "out.bed"};
    int argc = 11;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.fasta_path, "in.fa");
    EXPECT_EQ(config.window_size, 25u);
    EXPECT_DOUBLE_EQ(config.percentage, 90.5);
    EXPECT_EQ(config.nucleotide, "g");
    EXPECT_EQ(config.output_path, "out.bed");
}

TEST(ArgParserTest, Defaults) {
    Config config;
    const char* argv[] = {"polyscan", "--fasta", "in.fa"};
    int argc = 3;

    ASSERT_TRUE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
    EXPECT_EQ(config.window_size, 10u);
    EXPECT_DOUBLE_EQ(config.percentage, 80.0);
    EXPECT_EQ(config.nucleotide, "A");
    EXPECT_EQ(config.output_path, "-");
    EXPECT_EQ(config.log_level, LogLevel::LOG_WARN);
}

TEST(ArgParserTest, LogLevelIsCaseInsensitive) {
    Config config;
    const char* argv[] = {"polyscan", "-f", "in.fa", "--log-level", "DEBUG"};
    int argc = 5;

    ASSERT_TRUE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
    EXPECT_EQ(config.log_level, LogLevel::LOG_DEBUG);
    EXPECT_TRUE(config.is_debug());
}

TEST(ArgParserTest, MissingFastaFails) {
    Config config;
    const char* argv[] = {"polyscan", "-w", "10"};
    int argc = 3;
    int exit_code = 0;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config, exit_code));
    EXPECT_NE(exit_code, 0);
}

TEST(ArgParserTest, PercentageOutOfRangeFails) {
    Config config;
    const char* argv[] = {"polyscan", "-f", "in.fa", "-p", "40"};
    int argc = 5;
    int exit_code = 0;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config, exit_code));
    EXPECT_NE(exit_code, 0);
}

TEST(ArgParserTest, ZeroWindowFails) {
    Config config;
    const char* argv[] = {"polyscan", "-f", "in.fa", "-w", "0"};
    int argc = 5;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
}

TEST(ArgParserTest, HelpStopsWithZeroExitCode) {
    Config config;
    const char* argv[] = {"polyscan", "--help"};
    int argc = 2;
    int exit_code = -1;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config, exit_code));
    EXPECT_EQ(exit_code, 0);
}
