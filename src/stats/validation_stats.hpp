#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include "protocol/validation_contract.hpp"

namespace warden::stats {

// Plain copy of the counters at one point in time.
struct ValidationStatsSnapshot {
    std::uint64_t commands_validated = 0;
    std::uint64_t commands_blocked = 0;
    std::uint64_t commands_warned = 0;
    std::uint64_t files_validated = 0;
    std::uint64_t files_blocked = 0;
    std::uint64_t obfuscation_detected = 0;
    double avg_validation_time_ms = 0.0;
};

// Lock-free aggregation shared by every validator of one PolicyGuard.
// Counters use relaxed atomics: a snapshot taken during concurrent updates
// may mix values from neighbouring instants.
class ValidationStats {
public:
    void record_command(protocol::SecurityAction action, bool obfuscated,
                        std::chrono::nanoseconds duration) noexcept;
    void record_file(protocol::SecurityAction action,
                     std::chrono::nanoseconds duration) noexcept;

    ValidationStatsSnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    void record_duration(std::chrono::nanoseconds duration) noexcept;

    std::atomic<std::uint64_t> commands_validated_{0};
    std::atomic<std::uint64_t> commands_blocked_{0};
    std::atomic<std::uint64_t> commands_warned_{0};
    std::atomic<std::uint64_t> files_validated_{0};
    std::atomic<std::uint64_t> files_blocked_{0};
    std::atomic<std::uint64_t> obfuscation_detected_{0};
    std::atomic<std::uint64_t> timed_validations_{0};
    std::atomic<std::uint64_t> total_duration_ns_{0};
};

}  // namespace warden::stats
