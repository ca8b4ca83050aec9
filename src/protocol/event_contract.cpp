#include "protocol/event_contract.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace keel::protocol {

std::string format_timestamp(const std::chrono::system_clock::time_point timestamp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count() %
                        1000;
    std::tm utc_tm{};
    gmtime_r(&seconds, &utc_tm);

    std::ostringstream out;
    out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
        << std::setfill('0') << millis << "Z";
    return out.str();
}

nlohmann::json event_to_json(const Event& event) {
    nlohmann::json out;
    out["ts"] = format_timestamp(event.timestamp);
    out["seq"] = event.sequence;
    out["type"] = event.type;
    out["trace_id"] = event.trace_id;
    out["span_id"] = event.span_id;
    out["payload"] = event.payload;
    return out;
}

}  // namespace keel::protocol
