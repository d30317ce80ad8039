#include "stats/validation_stats.hpp"

namespace warden::stats {

namespace {

constexpr auto kRelaxed = std::memory_order_relaxed;

}  // namespace

void ValidationStats::record_duration(const std::chrono::nanoseconds duration) noexcept {
    const auto ns = duration.count() > 0 ? static_cast<std::uint64_t>(duration.count()) : 0U;
    total_duration_ns_.fetch_add(ns, kRelaxed);
    timed_validations_.fetch_add(1, kRelaxed);
}

void ValidationStats::record_command(const protocol::SecurityAction action,
                                     const bool obfuscated,
                                     const std::chrono::nanoseconds duration) noexcept {
    commands_validated_.fetch_add(1, kRelaxed);
    if (action == protocol::SecurityAction::Deny) {
        commands_blocked_.fetch_add(1, kRelaxed);
    } else if (action == protocol::SecurityAction::Ask) {
        commands_warned_.fetch_add(1, kRelaxed);
    }
    if (obfuscated) {
        obfuscation_detected_.fetch_add(1, kRelaxed);
    }
    record_duration(duration);
}

void ValidationStats::record_file(const protocol::SecurityAction action,
                                  const std::chrono::nanoseconds duration) noexcept {
    files_validated_.fetch_add(1, kRelaxed);
    if (action == protocol::SecurityAction::Deny) {
        files_blocked_.fetch_add(1, kRelaxed);
    }
    record_duration(duration);
}

ValidationStatsSnapshot ValidationStats::snapshot() const noexcept {
    ValidationStatsSnapshot snap;
    snap.commands_validated = commands_validated_.load(kRelaxed);
    snap.commands_blocked = commands_blocked_.load(kRelaxed);
    snap.commands_warned = commands_warned_.load(kRelaxed);
    snap.files_validated = files_validated_.load(kRelaxed);
    snap.files_blocked = files_blocked_.load(kRelaxed);
    snap.obfuscation_detected = obfuscation_detected_.load(kRelaxed);

    const std::uint64_t count = timed_validations_.load(kRelaxed);
    if (count > 0) {
        const auto total_ns = static_cast<double>(total_duration_ns_.load(kRelaxed));
        snap.avg_validation_time_ms = total_ns / static_cast<double>(count) / 1.0e6;
    }
    return snap;
}

void ValidationStats::reset() noexcept {
    commands_validated_.store(0, kRelaxed);
    commands_blocked_.store(0, kRelaxed);
    commands_warned_.store(0, kRelaxed);
    files_validated_.store(0, kRelaxed);
    files_blocked_.store(0, kRelaxed);
    obfuscation_detected_.store(0, kRelaxed);
    timed_validations_.store(0, kRelaxed);
    total_duration_ns_.store(0, kRelaxed);
}

}  // namespace warden::stats
