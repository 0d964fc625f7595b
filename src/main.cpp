#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/SequenceProcessor.hpp"
#include "io/BedWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    PolyScan::Utils::ResourceMonitor monitor;

    PolyScan::Config config;

    int exit_code = 0;
    if (!PolyScan::Utils::ArgParser::parse(argc, argv, config, exit_code)) {
        return exit_code;  // Parse failed, or help/version printed
    }

    // Configure Logger
    auto& logger = PolyScan::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        if (!config.validate()) {
            LOG_ERROR("Configuration validation failed.");
            return 1;
        }

        config.print();

        PolyScan::SequenceProcessor processor(config);
        PolyScan::BedWriter writer(config.output_path);

        PolyScan::ScanSummary summary;
        {
            PolyScan::Utils::ScopedLogger main_scope("Scan " + config.fasta_path);
            summary = processor.process_all(writer);
        }

        processor.print_summary(summary);
        monitor.print_stats("Total Execution", summary.num_bases);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
