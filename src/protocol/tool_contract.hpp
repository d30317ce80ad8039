#pragma once
#include <string>

namespace warden::protocol {

    // A tool invocation proposed by the agent, as seen by the interception layer
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "bash", "read", "write"
        std::string arguments;  // Raw JSON string of the arguments
    };

} // namespace warden::protocol
