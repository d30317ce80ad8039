#include "app/batch_runner.hpp"

#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "report/report_writer.hpp"

namespace warden::app {

using nlohmann::json;
using protocol::SecurityAction;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

protocol::ValidationResult malformed_line(const std::string& why) {
    return protocol::make_verdict(SecurityAction::Deny, why, "malformed-input",
                                  "malformed-input");
}

}  // namespace

BatchSummary run_batch(std::istream& in, std::ostream& out,
                       const tools::ToolInputRouter& router) {
    BatchSummary summary;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }

        json id = nullptr;
        protocol::ValidationResult result;
        const json call = json::parse(line, nullptr, false);
        if (call.is_discarded() || !call.is_object()) {
            result = malformed_line("Batch line is not a JSON object");
        } else {
            const auto id_it = call.find("id");
            if (id_it != call.end()) {
                id = *id_it;
            }
            const auto tool_it = call.find("tool");
            if (tool_it == call.end() || !tool_it->is_string()) {
                result = malformed_line("Batch line has no \"tool\" string");
            } else {
                const auto input_it = call.find("input");
                const json input = input_it != call.end() ? *input_it : json::object();
                result = router.route(tool_it->get<std::string>(), input);
            }
        }

        if (result.matched_pattern == std::string("malformed-input")) {
            ++summary.malformed;
            WARDEN_LOG_WARN("Batch: line " + std::to_string(line_number) + ": " +
                            result.reason.value_or(""));
        }
        ++summary.processed;
        summary.most_severe = report::most_severe(summary.most_severe, result.action);

        json record = report::result_to_json(result);
        record["id"] = id;
        out << record.dump() << "\n";
    }

    out << json{{"stats", report::stats_to_json(router.guard().stats_snapshot())}}.dump()
        << "\n";
    out.flush();
    return summary;
}

}  // namespace warden::app
