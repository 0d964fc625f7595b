#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

#include "utils/Logger.hpp"

namespace PolyScan {
namespace Utils {

class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        auto end_time = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = end_time - start_time_;
        return elapsed.count();
    }

    // Returns allocated memory in bytes (0 without jemalloc)
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));

        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    /**
     * @brief Log elapsed time, memory and, when bases > 0, scan throughput.
     */
    void print_stats(const std::string& label = "Execution", uint64_t bases = 0) const {
        double time = get_elapsed_seconds();

        std::ostringstream ss;
        ss << "[" << label << "] ";
        ss << "Time: " << std::fixed << std::setprecision(4) << time << " s";

        if (bases > 0 && time > 0.0) {
            ss << ", Throughput: " << std::setprecision(2) << (bases / time / 1e6) << " Mbp/s";
        }

#ifdef USE_JEMALLOC
        size_t mem = get_memory_usage();
        ss << ", Memory: " << std::fixed << std::setprecision(2) << (mem / 1024.0 / 1024.0) << " MB";
#endif
        LOG_INFO(ss.str());
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace PolyScan
