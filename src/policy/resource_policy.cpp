#include "policy/resource_policy.hpp"

#include <cmath>

namespace sandgrade::policy {

std::int64_t ResourcePolicy::CpuQuotaMicros() const {
    return static_cast<std::int64_t>(std::llround(cpus * static_cast<double>(kCpuPeriodMicros)));
}

std::vector<std::string> ResourcePolicy::Validate() const {
    std::vector<std::string> problems;
    // docker refuses memory limits below 6 MiB
    if (memory_bytes < 6LL * 1024 * 1024) {
        problems.push_back("memory ceiling must be at least 6 MiB");
    }
    if (!(cpus > 0.0) || CpuQuotaMicros() < 1000) {
        problems.push_back("cpu share must be at least 0.01");
    }
    if (wall_clock_timeout.count() <= 0) {
        problems.push_back("wall-clock timeout must be positive");
    }
    if (pids_limit <= 0) {
        problems.push_back("pids limit must be positive");
    }
    if (IsRootUser(user)) {
        problems.push_back("sandbox user must be non-root (got '" + user + "')");
    }
    if (!network_disabled) {
        problems.push_back("networking must be disabled");
    }
    if (!read_only_root) {
        problems.push_back("root filesystem must be read-only");
    }
    if (scratch_bytes <= 0) {
        problems.push_back("scratch area size must be positive");
    }
    if (max_log_bytes == 0 || max_report_bytes == 0) {
        problems.push_back("log and report caps must be positive");
    }
    if (kill_grace.count() < 0) {
        problems.push_back("kill grace must not be negative");
    }
    return problems;
}

bool IsRootUser(const std::string& user) {
    if (user.empty()) {
        return true;
    }
    const auto colon = user.find(':');
    const auto name = user.substr(0, colon);
    return name.empty() || name == "root" || name == "0";
}

}  // namespace sandgrade::policy
