#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace keel::core::config {

    // 8 random hex characters, used to keep ids unique within one second.
    inline std::string random_hex_suffix() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Trace ids look like "deploy_20261019_201100_3fa9c2d1".
    inline std::string generate_trace_id(const std::string& prefix = "deploy") {
        const std::time_t now =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_tm{};
        localtime_r(&now, &local_tm);

        std::stringstream ss;
        ss << prefix << "_" << std::put_time(&local_tm, "%Y%m%d_%H%M%S") << "_"
           << random_hex_suffix();
        return ss.str();
    }

} // namespace keel::core::config
