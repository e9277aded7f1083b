#include <pipeline/types.hpp>

#include <iomanip>
#include <sstream>

namespace vs {
    std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
                out.push_back(c);
            } else if (c == '\n' || c == '\r') {
                out.push_back(' ');
            } else if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream hex;
                hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                out += hex.str();
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    std::string stats_to_json(const PipelineStats& s) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        oss << "{"
            << R"("frames_captured":)" << s.frames_captured << ","
            << R"("inbound_dropped":)" << s.inbound_dropped << ","
            << R"("jobs_processed":)" << s.jobs_processed << ","
            << R"("passthrough":)" << s.passthrough << ","
            << R"("transform_failures":)" << s.transform_failures << ","
            << R"("results_overwritten":)" << s.results_overwritten << ","
            << R"("stale_discarded":)" << s.stale_discarded << ","
            << R"("frames_presented":)" << s.frames_presented << ","
            << R"("repeats":)" << s.repeats << ","
            << R"("presentation_timeouts":)" << s.presentation_timeouts << ","
            << R"("avg_worker_latency_ms":)" << s.avg_worker_latency_ms << ","
            << R"("stop_reason":")" << to_string(s.stop_reason) << "\"";

        if (!s.failure_message.empty()) {
            oss << R"(,"failure_message":")" << json_escape(s.failure_message) << "\"";
        }
        oss << "}";
        return oss.str();
    }
}
