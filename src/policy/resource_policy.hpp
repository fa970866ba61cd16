#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sandgrade::policy {

// Limits applied to every sandbox regardless of track. Loaded once at
// startup and never mutated afterwards.
struct ResourcePolicy {
    std::int64_t memory_bytes = 512LL * 1024 * 1024;
    double cpus = 0.5;
    std::chrono::milliseconds wall_clock_timeout{30000};
    std::int64_t pids_limit = 128;
    std::string user = "sandbox:sandbox";
    bool network_disabled = true;
    bool read_only_root = true;
    std::int64_t scratch_bytes = 64LL * 1024 * 1024;
    std::size_t max_log_bytes = 1024 * 1024;
    std::size_t max_report_bytes = 1024 * 1024;
    std::chrono::milliseconds kill_grace{2000};

    static constexpr std::int64_t kCpuPeriodMicros = 100000;

    std::int64_t CpuQuotaMicros() const;
    std::vector<std::string> Validate() const;
};

bool IsRootUser(const std::string& user);

}  // namespace sandgrade::policy
