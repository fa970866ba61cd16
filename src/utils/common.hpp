#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace sandgrade::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline long long ToMillis(std::chrono::steady_clock::duration duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Short random hex token for staging directories and container names.
inline std::string RandomHex(std::size_t length = 12) {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static const char kDigits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[dist(engine)]);
    }
    return out;
}

}  // namespace sandgrade::utils
