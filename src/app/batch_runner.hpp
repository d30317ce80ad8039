#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include "protocol/validation_contract.hpp"
#include "tools/tool_input_router.hpp"

namespace warden::app {

struct BatchSummary {
    std::size_t processed = 0;
    std::size_t malformed = 0;
    protocol::SecurityAction most_severe = protocol::SecurityAction::Allow;
};

// Reads one JSON object per line, {"id": ..., "tool": "...", "input": ...},
// and writes one result object per line carrying the same id. Blank lines
// are skipped. A line that cannot be read as a tool call gets a deny result
// and processing continues. A final {"stats": {...}} line closes the output.
BatchSummary run_batch(std::istream& in, std::ostream& out,
                       const tools::ToolInputRouter& router);

}  // namespace warden::app
